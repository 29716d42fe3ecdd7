#pragma once

#include <kvcache/listeners/IStoreListener.hpp>
#include <atomic>
#include <cstdint>

/**
 * @brief Слушатель для сбора статистики хранилища
 *
 * Собирает:
 * - hits/misses: для расчёта hit rate
 * - sets/failedSets/removes/expirations/clears/ioErrors
 *
 * Использование:
 *   auto stats = std::make_shared<StatsListener>();
 *   store.addListener(stats);
 *   // ... работа с хранилищем ...
 *   std::cout << "Hit rate: " << stats->hitRate() << std::endl;
 *
 * Примечание: счётчики atomic, слушателя можно читать из другого потока.
 */
class StatsListener : public IStoreListener {
public:
    void onHit(const std::string& key) override {
        (void)key;
        ++hits_;
    }

    void onMiss(const std::string& key) override {
        (void)key;
        ++misses_;
    }

    void onSet(const std::string& key, bool stored) override {
        (void)key;
        if (stored) {
            ++sets_;
        } else {
            ++failedSets_;
        }
    }

    void onRemove(const std::string& key, bool removed) override {
        (void)key;
        if (removed) {
            ++removes_;
        }
    }

    void onExpire(const std::string& key) override {
        (void)key;
        ++expirations_;
    }

    void onClear() override {
        ++clears_;
    }

    void onIoError(const std::string& path, const std::string& message) override {
        (void)path; (void)message;
        ++ioErrors_;
    }

    // ==================== Геттеры ====================

    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }
    uint64_t sets() const { return sets_; }
    uint64_t failedSets() const { return failedSets_; }
    uint64_t removes() const { return removes_; }
    uint64_t expirations() const { return expirations_; }
    uint64_t clears() const { return clears_; }
    uint64_t ioErrors() const { return ioErrors_; }

    /**
     * @brief Общее количество запросов get()
     */
    uint64_t totalRequests() const {
        return hits_ + misses_;
    }

    /**
     * @brief Процент попаданий (0.0 - 1.0)
     * @return hit rate или 0.0 если запросов не было
     */
    double hitRate() const {
        uint64_t total = totalRequests();
        if (total == 0) return 0.0;
        return static_cast<double>(hits_) / static_cast<double>(total);
    }

    void reset() {
        hits_ = 0;
        misses_ = 0;
        sets_ = 0;
        failedSets_ = 0;
        removes_ = 0;
        expirations_ = 0;
        clears_ = 0;
        ioErrors_ = 0;
    }

private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> sets_{0};
    std::atomic<uint64_t> failedSets_{0};
    std::atomic<uint64_t> removes_{0};
    std::atomic<uint64_t> expirations_{0};
    std::atomic<uint64_t> clears_{0};
    std::atomic<uint64_t> ioErrors_{0};
};
