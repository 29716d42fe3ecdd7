#pragma once

#include <chrono>
#include <functional>
#include <optional>

/// Момент времени с точностью до секунды (так он хранится на диске)
using Instant = std::chrono::time_point<std::chrono::system_clock,
                                        std::chrono::seconds>;

/// Время жизни записи; nullopt: бессрочно
using Ttl = std::optional<std::chrono::seconds>;

/// Источник текущего времени (подменяется в тестах)
using NowFn = std::function<Instant()>;

/**
 * @brief Запись кэша: значение + момент истечения
 * @tparam V Тип значения
 *
 * expiresAt == nullopt означает «никогда не истекает».
 */
template<typename V>
struct CacheRecord {
    V value{};
    std::optional<Instant> expiresAt;
};
