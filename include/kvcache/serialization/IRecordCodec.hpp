#pragma once

#include <kvcache/CacheRecord.hpp>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Интерфейс кодека записи кэша
 * @tparam V Тип значения
 *
 * Отвечает только за преобразование записи в байты и обратно.
 * Не знает о файлах: путь и запись на диск делает RecordDirectory.
 *
 * Реализации:
 * - BinaryRecordCodec: компактный бинарный формат, сохраняет точный тип
 * - JsonRecordCodec: человекочитаемый JSON {"value", "expiration"}
 */
template<typename V>
class IRecordCodec {
public:
    virtual ~IRecordCodec() = default;

    /**
     * @brief Закодировать запись
     * @param record Запись (значение + момент истечения)
     * @return Байтовое представление
     */
    virtual std::vector<uint8_t> encode(const CacheRecord<V>& record) const = 0;

    /**
     * @brief Декодировать запись
     * @param data Содержимое файла
     * @return Запись
     * @throws CorruptRecordError если байты не образуют запись ожидаемого вида
     */
    virtual CacheRecord<V> decode(const std::vector<uint8_t>& data) const = 0;

    /**
     * @brief Расширение файла для этого формата ("" или ".json")
     */
    virtual std::string extension() const = 0;
};

/**
 * @brief Признак «пустого» значения
 *
 * has() файловых хранилищ определён как «get() вернул не-null».
 * Для типов без null-состояния всегда false; для JSON специализация
 * объявлена рядом с JsonRecordCodec.
 */
template<typename V>
struct NullSentinel {
    static bool isNull(const V& value) {
        (void)value;
        return false;
    }
};
