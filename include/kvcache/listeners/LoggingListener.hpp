#pragma once

#include <kvcache/listeners/IStoreListener.hpp>
#include <iostream>
#include <string>

/**
 * @brief Слушатель для логирования событий хранилища в поток
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener>("files");
 *   store.addListener(logger);
 *
 * Для отключения логирования: просто не добавляем слушателя.
 */
class LoggingListener : public IStoreListener {
public:
    /**
     * @brief Конструктор
     * @param prefix Префикс для всех сообщений (например, имя хранилища)
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingListener(const std::string& prefix = "Store",
                             std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onHit(const std::string& key) override {
        os_ << "[" << prefix_ << "] HIT: " << key << "\n";
    }

    void onMiss(const std::string& key) override {
        os_ << "[" << prefix_ << "] MISS: " << key << "\n";
    }

    void onSet(const std::string& key, bool stored) override {
        os_ << "[" << prefix_ << "] SET: " << key
            << (stored ? "" : " (failed)") << "\n";
    }

    void onRemove(const std::string& key, bool removed) override {
        os_ << "[" << prefix_ << "] REMOVE: " << key
            << (removed ? "" : " (not found)") << "\n";
    }

    void onExpire(const std::string& key) override {
        os_ << "[" << prefix_ << "] EXPIRE: " << key << "\n";
    }

    void onClear() override {
        os_ << "[" << prefix_ << "] CLEAR\n";
    }

    void onIoError(const std::string& path, const std::string& message) override {
        os_ << "[" << prefix_ << "] IO ERROR: " << path << ": " << message << "\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
};
