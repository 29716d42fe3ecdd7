#pragma once

#include <kvcache/Errors.hpp>
#include <kvcache/serialization/IRecordCodec.hpp>
#include <cstdint>
#include <cstring>
#include <map>
#include <string>
#include <type_traits>
#include <vector>

// ==================== Чтение/запись little-endian ====================

struct ByteIO {
    static void appendUint32(std::vector<uint8_t>& data, uint32_t value) {
        data.push_back(static_cast<uint8_t>(value & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    }

    static void appendInt64(std::vector<uint8_t>& data, int64_t value) {
        auto bits = static_cast<uint64_t>(value);
        for (int shift = 0; shift < 64; shift += 8) {
            data.push_back(static_cast<uint8_t>((bits >> shift) & 0xFF));
        }
    }

    static bool readUint32(const std::vector<uint8_t>& data, size_t& offset,
                           uint32_t& value) {
        if (offset + 4 > data.size()) {
            return false;
        }
        value = static_cast<uint32_t>(data[offset]) |
               (static_cast<uint32_t>(data[offset + 1]) << 8) |
               (static_cast<uint32_t>(data[offset + 2]) << 16) |
               (static_cast<uint32_t>(data[offset + 3]) << 24);
        offset += 4;
        return true;
    }

    static bool readInt64(const std::vector<uint8_t>& data, size_t& offset,
                          int64_t& value) {
        if (offset + 8 > data.size()) {
            return false;
        }
        uint64_t bits = 0;
        for (int i = 0; i < 8; ++i) {
            bits |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
        }
        value = static_cast<int64_t>(bits);
        offset += 8;
        return true;
    }

    static bool readBytes(const std::vector<uint8_t>& data, size_t& offset,
                          size_t count, std::vector<uint8_t>& out) {
        if (count > data.size() - offset) {
            return false;
        }
        out.assign(data.begin() + offset, data.begin() + offset + count);
        offset += count;
        return true;
    }
};

// ==================== Кодирование значений по типу ====================

/**
 * @brief Бинарное представление значения типа T
 *
 * Каждая специализация даёт:
 * - signature(): дескриптор типа, записываемый в заголовок файла;
 * - write(): байты значения;
 * - read(): разбор, false при нехватке/мусоре.
 *
 * Неподдерживаемый тип: ошибка компиляции (нет определения).
 */
template<typename T, typename Enable = void>
struct BinaryValue;

/**
 * @brief Беззнаковое целое того же размера, что и T (битовое представление)
 */
template<size_t Size> struct UnsignedBits;
template<> struct UnsignedBits<1> { using type = uint8_t; };
template<> struct UnsignedBits<2> { using type = uint16_t; };
template<> struct UnsignedBits<4> { using type = uint32_t; };
template<> struct UnsignedBits<8> { using type = uint64_t; };

/**
 * @brief Арифметические типы (кроме bool): 'i'/'u'/'f' + размер
 *
 * Байты пишутся в little-endian независимо от платформы,
 * float/double: как битовое представление IEEE 754.
 */
template<typename T>
struct BinaryValue<T, typename std::enable_if<
        std::is_arithmetic<T>::value && !std::is_same<T, bool>::value>::type> {
    using Bits = typename UnsignedBits<sizeof(T)>::type;

    static std::string signature() {
        char kind = std::is_floating_point<T>::value ? 'f'
                  : std::is_signed<T>::value ? 'i' : 'u';
        return std::string(1, kind) + std::to_string(sizeof(T));
    }

    static void write(std::vector<uint8_t>& out, const T& value) {
        Bits bits;
        std::memcpy(&bits, &value, sizeof(T));
        for (size_t i = 0; i < sizeof(T); ++i) {
            out.push_back(static_cast<uint8_t>((static_cast<uint64_t>(bits) >> (8 * i)) & 0xFF));
        }
    }

    static bool read(const std::vector<uint8_t>& data, size_t& offset, T& value) {
        if (offset + sizeof(T) > data.size()) {
            return false;
        }
        uint64_t bits = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            bits |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
        }
        Bits narrow = static_cast<Bits>(bits);
        std::memcpy(&value, &narrow, sizeof(T));
        offset += sizeof(T);
        return true;
    }
};

template<>
struct BinaryValue<bool> {
    static std::string signature() { return "b"; }

    static void write(std::vector<uint8_t>& out, const bool& value) {
        out.push_back(value ? 1 : 0);
    }

    static bool read(const std::vector<uint8_t>& data, size_t& offset, bool& value) {
        if (offset >= data.size() || data[offset] > 1) {
            return false;
        }
        value = data[offset] == 1;
        ++offset;
        return true;
    }
};

template<>
struct BinaryValue<std::string> {
    static std::string signature() { return "s"; }

    static void write(std::vector<uint8_t>& out, const std::string& value) {
        ByteIO::appendUint32(out, static_cast<uint32_t>(value.size()));
        out.insert(out.end(), value.begin(), value.end());
    }

    static bool read(const std::vector<uint8_t>& data, size_t& offset,
                     std::string& value) {
        uint32_t size = 0;
        std::vector<uint8_t> raw;
        if (!ByteIO::readUint32(data, offset, size) ||
            !ByteIO::readBytes(data, offset, size, raw)) {
            return false;
        }
        value.assign(raw.begin(), raw.end());
        return true;
    }
};

/**
 * @brief Сырые байты: отдельный тип, не путается со строкой
 */
template<>
struct BinaryValue<std::vector<uint8_t>> {
    static std::string signature() { return "y"; }

    static void write(std::vector<uint8_t>& out, const std::vector<uint8_t>& value) {
        ByteIO::appendUint32(out, static_cast<uint32_t>(value.size()));
        out.insert(out.end(), value.begin(), value.end());
    }

    static bool read(const std::vector<uint8_t>& data, size_t& offset,
                     std::vector<uint8_t>& value) {
        uint32_t size = 0;
        return ByteIO::readUint32(data, offset, size) &&
               ByteIO::readBytes(data, offset, size, value);
    }
};

template<typename T>
struct BinaryValue<std::vector<T>> {
    static std::string signature() { return "v" + BinaryValue<T>::signature(); }

    static void write(std::vector<uint8_t>& out, const std::vector<T>& value) {
        ByteIO::appendUint32(out, static_cast<uint32_t>(value.size()));
        for (const auto& item : value) {
            BinaryValue<T>::write(out, item);
        }
    }

    static bool read(const std::vector<uint8_t>& data, size_t& offset,
                     std::vector<T>& value) {
        uint32_t count = 0;
        if (!ByteIO::readUint32(data, offset, count)) {
            return false;
        }
        value.clear();
        for (uint32_t i = 0; i < count; ++i) {
            T item{};
            if (!BinaryValue<T>::read(data, offset, item)) {
                return false;
            }
            value.push_back(std::move(item));
        }
        return true;
    }
};

template<typename T>
struct BinaryValue<std::map<std::string, T>> {
    static std::string signature() { return "m" + BinaryValue<T>::signature(); }

    static void write(std::vector<uint8_t>& out,
                      const std::map<std::string, T>& value) {
        ByteIO::appendUint32(out, static_cast<uint32_t>(value.size()));
        for (const auto& [key, item] : value) {
            BinaryValue<std::string>::write(out, key);
            BinaryValue<T>::write(out, item);
        }
    }

    static bool read(const std::vector<uint8_t>& data, size_t& offset,
                     std::map<std::string, T>& value) {
        uint32_t count = 0;
        if (!ByteIO::readUint32(data, offset, count)) {
            return false;
        }
        value.clear();
        for (uint32_t i = 0; i < count; ++i) {
            std::string key;
            T item{};
            if (!BinaryValue<std::string>::read(data, offset, key) ||
                !BinaryValue<T>::read(data, offset, item)) {
                return false;
            }
            value.emplace(std::move(key), std::move(item));
        }
        return true;
    }
};

// ==================== Кодек записи ====================

/**
 * @brief Бинарный кодек записи кэша
 * @tparam V Тип значения
 *
 * Формат файла:
 * [4 байта: magic "KVRC"]
 * [4 байта: версия формата]
 * [4 байта: длина сигнатуры типа][N байт: сигнатура]
 * [1 байт: есть ли срок истечения]
 * [8 байт: момент истечения, секунды epoch (0 если нет)]
 * [4 байта: длина значения][M байт: значение]
 *
 * Сигнатура фиксирует точный тип значения: файл, записанный как int32,
 * не прочитается как double или строка. Бинарные данные (std::vector<uint8_t>)
 * сохраняются байт в байт.
 *
 * Все числа (заголовок, длины, арифметические значения) в little-endian.
 *
 * Поддерживаемые типы: bool, арифметические до 8 байт, std::string,
 * std::vector<uint8_t>, std::vector<T>, std::map<std::string, T>.
 */
template<typename V>
class BinaryRecordCodec : public IRecordCodec<V> {
public:
    static constexpr uint32_t MAGIC = 0x4352564B;  // "KVRC" в little-endian
    static constexpr uint32_t VERSION = 1;

    std::vector<uint8_t> encode(const CacheRecord<V>& record) const override {
        std::vector<uint8_t> result;

        ByteIO::appendUint32(result, MAGIC);
        ByteIO::appendUint32(result, VERSION);

        std::string signature = BinaryValue<V>::signature();
        ByteIO::appendUint32(result, static_cast<uint32_t>(signature.size()));
        result.insert(result.end(), signature.begin(), signature.end());

        result.push_back(record.expiresAt.has_value() ? 1 : 0);
        ByteIO::appendInt64(result, record.expiresAt.has_value()
            ? record.expiresAt->time_since_epoch().count() : 0);

        std::vector<uint8_t> payload;
        BinaryValue<V>::write(payload, record.value);
        ByteIO::appendUint32(result, static_cast<uint32_t>(payload.size()));
        result.insert(result.end(), payload.begin(), payload.end());

        return result;
    }

    CacheRecord<V> decode(const std::vector<uint8_t>& data) const override {
        size_t offset = 0;

        uint32_t magic = 0;
        if (!ByteIO::readUint32(data, offset, magic) || magic != MAGIC) {
            throw CorruptRecordError("Invalid record: wrong magic number");
        }

        uint32_t version = 0;
        if (!ByteIO::readUint32(data, offset, version)) {
            throw CorruptRecordError("Invalid record: truncated header");
        }
        if (version != VERSION) {
            throw CorruptRecordError("Unsupported record version: " +
                                     std::to_string(version));
        }

        uint32_t signatureSize = 0;
        std::vector<uint8_t> signature;
        if (!ByteIO::readUint32(data, offset, signatureSize) ||
            !ByteIO::readBytes(data, offset, signatureSize, signature)) {
            throw CorruptRecordError("Invalid record: truncated type signature");
        }
        std::string expected = BinaryValue<V>::signature();
        if (std::string(signature.begin(), signature.end()) != expected) {
            throw CorruptRecordError("Invalid record: stored type '" +
                std::string(signature.begin(), signature.end()) +
                "' does not match '" + expected + "'");
        }

        if (offset >= data.size() || data[offset] > 1) {
            throw CorruptRecordError("Invalid record: bad expiration flag");
        }
        bool hasExpiry = data[offset++] == 1;

        int64_t expiry = 0;
        if (!ByteIO::readInt64(data, offset, expiry)) {
            throw CorruptRecordError("Invalid record: truncated expiration");
        }

        uint32_t payloadSize = 0;
        std::vector<uint8_t> payload;
        if (!ByteIO::readUint32(data, offset, payloadSize) ||
            !ByteIO::readBytes(data, offset, payloadSize, payload)) {
            throw CorruptRecordError("Invalid record: truncated value");
        }
        if (offset != data.size()) {
            throw CorruptRecordError("Invalid record: trailing bytes");
        }

        CacheRecord<V> record;
        size_t payloadOffset = 0;
        if (!BinaryValue<V>::read(payload, payloadOffset, record.value) ||
            payloadOffset != payload.size()) {
            throw CorruptRecordError("Invalid record: malformed value");
        }
        if (hasExpiry) {
            record.expiresAt = Instant(std::chrono::seconds(expiry));
        }
        return record;
    }

    std::string extension() const override {
        return "";
    }
};
