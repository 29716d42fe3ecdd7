#pragma once

#include <kvcache/ICacheStore.hpp>
#include <kvcache/listeners/StoreEvents.hpp>
#include <kvcache/validation/KeyValidator.hpp>
#include <memory>
#include <string>
#include <unordered_map>

/**
 * @brief Хранилище в памяти процесса
 * @tparam V Тип значения
 *
 * Базовый вариант и тестовый дублёр:
 * - данные в std::unordered_map, принадлежащей экземпляру;
 * - TTL не поддерживается: аргумент ttl игнорируется;
 * - синхронизации нет, использовать из одного потока.
 *
 * removeMultiple() возвращает false, если хотя бы один ключ не был удалён,
 * в отличие от PersistentStore, где пакет всегда true.
 */
template<typename V>
class InMemoryStore : public ICacheStore<V> {
public:
    using typename ICacheStore<V>::Entries;

    std::optional<V> get(const std::string& key) override {
        KeyValidator::validate(key);

        auto it = data_.find(key);
        if (it == data_.end()) {
            events_.miss(key);
            return std::nullopt;
        }

        events_.hit(key);
        return it->second;
    }

    V get(const std::string& key, const V& defaultValue) override {
        auto value = get(key);
        return value.has_value() ? value.value() : defaultValue;
    }

    bool set(const std::string& key, const V& value, Ttl ttl = std::nullopt) override {
        KeyValidator::validate(key);
        (void)ttl;

        data_[key] = value;
        events_.set(key, true);
        return true;
    }

    bool remove(const std::string& key) override {
        KeyValidator::validate(key);

        bool removed = data_.erase(key) > 0;
        events_.remove(key, removed);
        return removed;
    }

    bool clear() override {
        data_.clear();
        events_.clear();
        return true;
    }

    bool has(const std::string& key) override {
        KeyValidator::validate(key);
        return data_.find(key) != data_.end();
    }

    Entries getMultiple(const std::vector<std::string>& keys,
                        const V& defaultValue) override {
        KeyValidator::validateAll(keys);

        Entries result;
        result.reserve(keys.size());
        for (const auto& key : keys) {
            result.emplace_back(key, get(key, defaultValue));
        }
        return result;
    }

    bool setMultiple(const Entries& entries, Ttl ttl = std::nullopt) override {
        for (const auto& entry : entries) {
            KeyValidator::validate(entry.first);
        }

        for (const auto& [key, value] : entries) {
            set(key, value, ttl);
        }
        return true;
    }

    /**
     * @return false, если хотя бы одного ключа не было
     */
    bool removeMultiple(const std::vector<std::string>& keys) override {
        KeyValidator::validateAll(keys);

        bool success = true;
        for (const auto& key : keys) {
            if (!remove(key)) {
                success = false;
            }
        }
        return success;
    }

    size_t size() const {
        return data_.size();
    }

    void addListener(std::shared_ptr<IStoreListener> listener) {
        events_.addListener(std::move(listener));
    }

    void removeListener(const std::shared_ptr<IStoreListener>& listener) {
        events_.removeListener(listener);
    }

private:
    std::unordered_map<std::string, V> data_;
    StoreEvents events_;
};
