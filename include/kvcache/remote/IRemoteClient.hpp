#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Одна команда SET в конвейере
 */
struct SetCommand {
    std::string key;
    std::string value;
    std::optional<std::chrono::seconds> expire;  ///< SET ... EX n, если задано
};

/**
 * @brief Клиент удалённого key-value сервера (Redis-совместимого)
 *
 * Граница с внешним миром: протокол, соединение и таймауты остаются заботой
 * реализации. RedisStore обращается к серверу только через этот интерфейс.
 *
 * ack: true только для явного статуса OK.
 */
class IRemoteClient {
public:
    virtual ~IRemoteClient() = default;

    /// GET key
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /// SET key value [EX seconds]
    virtual bool set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::seconds> expire) = 0;

    /// DEL key [key ...]: количество удалённых ключей
    virtual int64_t del(const std::vector<std::string>& keys) = 0;

    /// MGET key [key ...]: значения в порядке ключей
    virtual std::vector<std::optional<std::string>> mget(
        const std::vector<std::string>& keys) = 0;

    /// EXISTS key
    virtual bool exists(const std::string& key) = 0;

    /// FLUSHALL
    virtual bool flushAll() = 0;

    /// Конвейер SET-команд за один round trip: по одному ack на команду
    virtual std::vector<bool> pipelineSet(const std::vector<SetCommand>& commands) = 0;
};
