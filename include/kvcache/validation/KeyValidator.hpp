#pragma once

#include <kvcache/Errors.hpp>
#include <string>
#include <vector>

/**
 * @brief Проверка формата ключа, общая для всех хранилищ
 *
 * Вызывается первой строкой каждой публичной операции: до хеширования
 * и любого I/O. Некорректный ключ не оставляет побочных эффектов:
 * ни файла, ни удалённого вызова.
 */
class KeyValidator {
public:
    /**
     * @brief Проверить ключ
     * @throws InvalidKeyError если ключ пустой
     */
    static void validate(const std::string& key) {
        if (key.empty()) {
            throw InvalidKeyError("Cache key cannot be empty");
        }
    }

    /**
     * @brief Проверить все ключи пакета до начала работы с ним
     */
    static void validateAll(const std::vector<std::string>& keys) {
        for (const auto& key : keys) {
            validate(key);
        }
    }
};
