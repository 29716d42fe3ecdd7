#pragma once

#include <openssl/evp.h>
#include <stdexcept>
#include <string>

/**
 * @brief Имя файла для ключа: MD5 сырой строки ключа в hex (32 символа)
 *
 * Ключ не попадает на диск как есть: только его дайджест, поэтому
 * любые символы ключа безопасны для файловой системы.
 * Коллизии MD5 считаются допустимым (крайне маловероятным) риском.
 */
inline std::string keyDigest(const std::string& key) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (EVP_Digest(key.data(), key.size(), digest, &length,
                   EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }

    static const char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        result.push_back(hex[digest[i] >> 4]);
        result.push_back(hex[digest[i] & 0x0F]);
    }
    return result;
}
