#pragma once

#include <kvcache/CacheRecord.hpp>
#include <chrono>
#include <optional>

/**
 * @brief Политика истечения срока действия для файловых хранилищ
 *
 * Переводит TTL в абсолютный момент истечения и проверяет,
 * жива ли запись. Время: секунды Unix epoch, как в формате файла.
 *
 * Граница включительная: запись с expiresAt == now ещё жива.
 * Отрицательный TTL не отвергается: он даёт момент в прошлом,
 * и следующее чтение считает запись просроченной. Нулевой TTL даёт
 * expiresAt == now, то есть запись живёт до конца текущей секунды.
 *
 * @note Стратегия ленивая: проверка происходит при чтении,
 *       фонового потока нет.
 */
class ExpirationPolicy {
public:
    /**
     * @brief Текущее время с точностью до секунды
     */
    static Instant systemNow() {
        return std::chrono::time_point_cast<std::chrono::seconds>(
            std::chrono::system_clock::now());
    }

    /**
     * @brief Абсолютный момент истечения
     * @param ttl Время жизни (nullopt: бессрочно)
     * @param now Текущий момент
     * @return now + ttl или nullopt
     *
     * Сумма насыщается на Instant::max() / Instant::min(): огромный TTL
     * (например, seconds::max()) даёт «вечную» запись, а не переполнение.
     */
    static std::optional<Instant> absoluteExpiry(Ttl ttl, Instant now) {
        if (!ttl.has_value()) {
            return std::nullopt;
        }

        std::chrono::seconds delta = ttl.value();
        if (delta > std::chrono::seconds::zero() && now > Instant::max() - delta) {
            return Instant::max();
        }
        if (delta < std::chrono::seconds::zero() && now < Instant::min() - delta) {
            return Instant::min();
        }
        return now + delta;
    }

    /**
     * @brief Жива ли запись в момент now
     */
    template<typename V>
    static bool isLive(const CacheRecord<V>& record, Instant now) {
        return !record.expiresAt.has_value() || record.expiresAt.value() >= now;
    }

    /**
     * @brief Оставшееся время жизни записи
     * @return nullopt для бессрочной записи, zero если уже истекла
     */
    template<typename V>
    static std::optional<std::chrono::seconds> remaining(
            const CacheRecord<V>& record, Instant now) {
        if (!record.expiresAt.has_value()) {
            return std::nullopt;
        }
        if (record.expiresAt.value() < now) {
            return std::chrono::seconds::zero();
        }
        return record.expiresAt.value() - now;
    }
};
