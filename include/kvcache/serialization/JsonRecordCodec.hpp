#pragma once

#include <kvcache/Errors.hpp>
#include <kvcache/serialization/IRecordCodec.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

/**
 * @brief JSON-кодек записи кэша
 * @tparam V Тип значения (должен конвертироваться через nlohmann to_json/from_json)
 *
 * Формат файла: объект ровно с двумя полями:
 * @code
 *   {"value": <любое JSON-значение>, "expiration": 1700000000 | null}
 * @endcode
 *
 * В отличие от BinaryRecordCodec, хранить можно только то, что
 * представимо в JSON: точный C++ тип не сохраняется (int64 и int32
 * выглядят одинаково), бинарные данные как строка должны быть валидным UTF-8.
 * Это плата за читаемость и переносимость файлов.
 */
template<typename V>
class JsonRecordCodec : public IRecordCodec<V> {
public:
    using json = nlohmann::json;

    /**
     * @throws nlohmann::json::type_error если значение не сериализуется в JSON
     *         (например, строка с невалидным UTF-8)
     */
    std::vector<uint8_t> encode(const CacheRecord<V>& record) const override {
        json document = json::object();
        document["value"] = record.value;
        if (record.expiresAt.has_value()) {
            document["expiration"] = record.expiresAt->time_since_epoch().count();
        } else {
            document["expiration"] = nullptr;
        }

        std::string text = document.dump();
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    CacheRecord<V> decode(const std::vector<uint8_t>& data) const override {
        json document = json::parse(data.begin(), data.end(), nullptr, false);
        if (document.is_discarded()) {
            throw CorruptRecordError("Invalid record: not a JSON document");
        }
        if (!document.is_object() || document.size() != 2 ||
            !document.contains("value") || !document.contains("expiration")) {
            throw CorruptRecordError(
                "Invalid record: expected object with 'value' and 'expiration'");
        }

        const json& expiration = document["expiration"];
        if (!expiration.is_null() && !expiration.is_number_integer()) {
            throw CorruptRecordError("Invalid record: 'expiration' must be integer or null");
        }
        if (expiration.is_number_unsigned() &&
            expiration.get<uint64_t>() >
                static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw CorruptRecordError("Invalid record: 'expiration' is out of range");
        }

        CacheRecord<V> record;
        try {
            record.value = document["value"].get<V>();
        } catch (const json::exception& e) {
            throw CorruptRecordError(std::string("Invalid record value: ") + e.what());
        }
        if (!expiration.is_null()) {
            record.expiresAt = Instant(std::chrono::seconds(expiration.get<int64_t>()));
        }
        return record;
    }

    std::string extension() const override {
        return ".json";
    }
};

/**
 * @brief JSON null считается «пустым» значением для has()
 */
template<>
struct NullSentinel<nlohmann::json> {
    static bool isNull(const nlohmann::json& value) {
        return value.is_null();
    }
};
