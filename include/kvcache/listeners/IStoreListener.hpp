#pragma once

#include <string>

/**
 * @brief Интерфейс слушателя событий хранилища
 *
 * Все методы имеют пустую реализацию: переопределяются только нужные.
 */
class IStoreListener {
public:
    virtual ~IStoreListener() = default;

    virtual void onHit(const std::string& key) { (void)key; }
    virtual void onMiss(const std::string& key) { (void)key; }
    virtual void onSet(const std::string& key, bool stored) { (void)key; (void)stored; }
    virtual void onRemove(const std::string& key, bool removed) { (void)key; (void)removed; }
    virtual void onExpire(const std::string& key) { (void)key; }
    virtual void onClear() {}
    virtual void onIoError(const std::string& path, const std::string& message) {
        (void)path; (void)message;
    }
};
