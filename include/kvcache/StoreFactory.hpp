#pragma once

#include <kvcache/Errors.hpp>
#include <kvcache/ICacheStore.hpp>
#include <kvcache/config/StoreConfig.hpp>
#include <kvcache/remote/HiredisClient.hpp>
#include <kvcache/remote/IRemoteClient.hpp>
#include <kvcache/stores/InMemoryStore.hpp>
#include <kvcache/stores/PersistentStore.hpp>
#include <kvcache/stores/RedisStore.hpp>
#include <memory>
#include <string>
#include <type_traits>

/**
 * @brief Создать хранилище по конфигурации
 * @tparam V Тип значения
 * @param config Конфигурация (проверяется через validate())
 * @param client Готовый клиент для Redis; если nullptr: создаётся HiredisClient
 *
 * Redis хранит строки, поэтому StoreBackend::Redis доступен только для
 * V = std::string.
 *
 * @throws InvalidArgumentError при некорректной конфигурации
 * @throws RemoteError если не удалось подключиться к Redis
 */
template<typename V>
std::unique_ptr<ICacheStore<V>> makeStore(const StoreConfig& config,
                                          std::shared_ptr<IRemoteClient> client = nullptr) {
    config.validate();

    switch (config.backend) {
    case StoreBackend::Memory:
        return std::make_unique<InMemoryStore<V>>();
    case StoreBackend::File:
        return makeFileStore<V>(config.directory);
    case StoreBackend::JsonFile:
        return makeJsonFileStore<V>(config.directory);
    case StoreBackend::Redis:
        if constexpr (std::is_same<V, std::string>::value) {
            if (!client) {
                client = std::make_shared<HiredisClient>(
                    config.redisHost, config.redisPort, config.redisTimeout);
            }
            return std::make_unique<RedisStore>(std::move(client));
        } else {
            throw InvalidArgumentError("Redis store supports only std::string values");
        }
    }
    throw InvalidArgumentError("Unknown store backend");
}
