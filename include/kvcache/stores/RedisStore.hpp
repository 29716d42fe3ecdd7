#pragma once

#include <kvcache/Errors.hpp>
#include <kvcache/ICacheStore.hpp>
#include <kvcache/listeners/StoreEvents.hpp>
#include <kvcache/remote/IRemoteClient.hpp>
#include <kvcache/validation/KeyValidator.hpp>
#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>

/**
 * @brief Хранилище поверх удалённого Redis-совместимого сервера
 *
 * Значения: строки, как их видит сервер. TTL обслуживает сам сервер (SET EX).
 *
 * Отличия от файловых хранилищ:
 * - TTL меньше секунды округляется вверх до 1 сек., «уже истёкшей»
 *   записи здесь не бывает;
 * - setMultiple(): один конвейер, false если хоть один ack не OK;
 * - removeMultiple(): один DEL, true если удалён хотя бы один ключ;
 * - has(): EXISTS, без чтения значения.
 *
 * Все ключи пакета проверяются до обращения к серверу.
 */
class RedisStore : public ICacheStore<std::string> {
public:
    /**
     * @param client Клиент сервера (ownership разделяется)
     * @throws InvalidArgumentError если client == nullptr
     */
    explicit RedisStore(std::shared_ptr<IRemoteClient> client)
        : client_(std::move(client))
    {
        if (!client_) {
            throw InvalidArgumentError("Remote client cannot be null");
        }
    }

    std::optional<std::string> get(const std::string& key) override {
        KeyValidator::validate(key);

        auto value = client_->get(key);
        if (value.has_value()) {
            events_.hit(key);
        } else {
            events_.miss(key);
        }
        return value;
    }

    std::string get(const std::string& key, const std::string& defaultValue) override {
        auto value = get(key);
        return value.has_value() ? value.value() : defaultValue;
    }

    bool set(const std::string& key, const std::string& value,
             Ttl ttl = std::nullopt) override {
        KeyValidator::validate(key);

        bool stored = client_->set(key, value, clampTtl(ttl));
        events_.set(key, stored);
        return stored;
    }

    bool remove(const std::string& key) override {
        KeyValidator::validate(key);

        bool removed = client_->del({key}) > 0;
        events_.remove(key, removed);
        return removed;
    }

    bool clear() override {
        bool flushed = client_->flushAll();
        if (flushed) {
            events_.clear();
        }
        return flushed;
    }

    bool has(const std::string& key) override {
        KeyValidator::validate(key);
        return client_->exists(key);
    }

    Entries getMultiple(const std::vector<std::string>& keys,
                        const std::string& defaultValue) override {
        KeyValidator::validateAll(keys);

        Entries result;
        if (keys.empty()) {
            return result;
        }

        auto values = client_->mget(keys);
        result.reserve(keys.size());
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i < values.size() && values[i].has_value()) {
                events_.hit(keys[i]);
                result.emplace_back(keys[i], values[i].value());
            } else {
                events_.miss(keys[i]);
                result.emplace_back(keys[i], defaultValue);
            }
        }
        return result;
    }

    /**
     * @brief Записать пакет одним конвейером
     * @return false, если хотя бы один ответ: не OK
     */
    bool setMultiple(const Entries& entries, Ttl ttl = std::nullopt) override {
        std::vector<SetCommand> commands;
        commands.reserve(entries.size());
        for (const auto& [key, value] : entries) {
            KeyValidator::validate(key);
            commands.push_back({key, value, clampTtl(ttl)});
        }

        if (commands.empty()) {
            return true;
        }

        auto acks = client_->pipelineSet(commands);
        bool success = acks.size() == commands.size() &&
            std::all_of(acks.begin(), acks.end(), [](bool ack) { return ack; });

        for (size_t i = 0; i < commands.size(); ++i) {
            events_.set(commands[i].key, i < acks.size() && acks[i]);
        }
        return success;
    }

    /**
     * @brief Удалить пакет одной командой DEL
     * @return true, если удалён хотя бы один ключ
     *
     * DEL возвращает только количество удалённых ключей. Слушатели получают
     * removed == true для каждого ключа, только если удалены все ключи;
     * при частичном удалении неизвестно, какие именно, и все события
     * идут с removed == false.
     */
    bool removeMultiple(const std::vector<std::string>& keys) override {
        KeyValidator::validateAll(keys);

        if (keys.empty()) {
            return false;
        }

        int64_t deleted = client_->del(keys);
        bool allRemoved = deleted == static_cast<int64_t>(keys.size());
        for (const auto& key : keys) {
            events_.remove(key, allRemoved);
        }
        return deleted > 0;
    }

    void addListener(std::shared_ptr<IStoreListener> listener) {
        events_.addListener(std::move(listener));
    }

    void removeListener(const std::shared_ptr<IStoreListener>& listener) {
        events_.removeListener(listener);
    }

private:
    /**
     * @brief TTL для SET EX: не меньше одной секунды
     */
    static std::optional<std::chrono::seconds> clampTtl(Ttl ttl) {
        if (!ttl.has_value()) {
            return std::nullopt;
        }
        return std::max(ttl.value(), std::chrono::seconds(1));
    }

    std::shared_ptr<IRemoteClient> client_;
    StoreEvents events_;
};
