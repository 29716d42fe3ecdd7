#pragma once

#include <kvcache/listeners/IStoreListener.hpp>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Набор слушателей одного хранилища
 *
 * Каждое хранилище владеет своим экземпляром (композиция, не базовый класс).
 * Без слушателей уведомление: проверка пустого вектора.
 */
class StoreEvents {
public:
    void addListener(std::shared_ptr<IStoreListener> listener) {
        if (listener) {
            listeners_.push_back(std::move(listener));
        }
    }

    void removeListener(const std::shared_ptr<IStoreListener>& listener) {
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end()
        );
    }

    size_t listenerCount() const {
        return listeners_.size();
    }

    void hit(const std::string& key) {
        for (auto& listener : listeners_) {
            listener->onHit(key);
        }
    }

    void miss(const std::string& key) {
        for (auto& listener : listeners_) {
            listener->onMiss(key);
        }
    }

    void set(const std::string& key, bool stored) {
        for (auto& listener : listeners_) {
            listener->onSet(key, stored);
        }
    }

    void remove(const std::string& key, bool removed) {
        for (auto& listener : listeners_) {
            listener->onRemove(key, removed);
        }
    }

    void expire(const std::string& key) {
        for (auto& listener : listeners_) {
            listener->onExpire(key);
        }
    }

    void clear() {
        for (auto& listener : listeners_) {
            listener->onClear();
        }
    }

    void ioError(const std::string& path, const std::string& message) {
        for (auto& listener : listeners_) {
            listener->onIoError(path, message);
        }
    }

private:
    std::vector<std::shared_ptr<IStoreListener>> listeners_;
};
