#pragma once

#include <kvcache/CacheRecord.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Единый контракт хранилища кэша
 * @tparam V Тип значения
 *
 * Реализации независимы друг от друга; общего базового поведения нет,
 * и особенности каждого бэкенда остаются в его реализации:
 *
 * | Бэкенд          | TTL                          | setMultiple / removeMultiple      |
 * |-----------------|------------------------------|-----------------------------------|
 * | InMemoryStore   | игнорируется                 | true / false, если хоть один miss |
 * | PersistentStore | ttl < 0: уже истёкшая,       | best-effort, всегда true          |
 * |                 | ttl == 0: до конца секунды   |                                   |
 * | RedisStore      | округляется вверх до 1 сек.  | false, если хоть один ack не OK / |
 * |                 |                              | true, если DEL удалил хоть один   |
 *
 * Пустой ключ в любой операции: InvalidKeyError до любого побочного эффекта.
 */
template<typename V>
class ICacheStore {
public:
    using Entries = std::vector<std::pair<std::string, V>>;

    virtual ~ICacheStore() = default;

    /**
     * @brief Получить значение по ключу
     * @return Значение или std::nullopt, если ключа нет / запись истекла
     */
    virtual std::optional<V> get(const std::string& key) = 0;

    /**
     * @brief Получить значение или defaultValue
     */
    virtual V get(const std::string& key, const V& defaultValue) = 0;

    /**
     * @brief Сохранить значение
     * @param ttl Время жизни (nullopt: бессрочно)
     * @return true, если значение сохранено
     */
    virtual bool set(const std::string& key, const V& value, Ttl ttl = std::nullopt) = 0;

    /**
     * @brief Удалить значение
     * @return true, если значение существовало и удалено
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * @brief Очистить хранилище
     */
    virtual bool clear() = 0;

    /**
     * @brief Проверить наличие ключа
     */
    virtual bool has(const std::string& key) = 0;

    /**
     * @brief Получить несколько значений
     * @return Пары (ключ, значение или defaultValue) в порядке входных ключей
     */
    virtual Entries getMultiple(const std::vector<std::string>& keys,
                                const V& defaultValue) = 0;

    /**
     * @brief Сохранить несколько значений с общим TTL
     */
    virtual bool setMultiple(const Entries& entries, Ttl ttl = std::nullopt) = 0;

    /**
     * @brief Удалить несколько значений
     */
    virtual bool removeMultiple(const std::vector<std::string>& keys) = 0;
};
