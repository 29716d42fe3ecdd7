#pragma once

#include <kvcache/Errors.hpp>
#include <chrono>
#include <string>

/**
 * @brief Тип бэкенда хранилища
 */
enum class StoreBackend {
    Memory,     ///< InMemoryStore
    File,       ///< PersistentStore + BinaryRecordCodec
    JsonFile,   ///< PersistentStore + JsonRecordCodec
    Redis       ///< RedisStore + HiredisClient
};

/**
 * @brief Конфигурация хранилища
 *
 * Обычная структура: откуда её заполнять (файл, переменные окружения,
 * аргументы командной строки): решает приложение.
 */
struct StoreConfig {
    // ========== ОБЩИЕ ==========

    StoreBackend backend = StoreBackend::Memory;

    // ========== ФАЙЛОВЫЕ БЭКЕНДЫ ==========

    /// Корневой каталог (создаётся при необходимости)
    std::string directory;

    // ========== REDIS ==========

    std::string redisHost = "127.0.0.1";
    int redisPort = 6379;

    /// Таймаут соединения и команд
    std::chrono::milliseconds redisTimeout{1000};

    // ========== ВСПОМОГАТЕЛЬНЫЕ МЕТОДЫ ==========

    /**
     * @brief Проверить согласованность параметров
     * @throws InvalidArgumentError
     */
    void validate() const {
        switch (backend) {
        case StoreBackend::Memory:
            break;
        case StoreBackend::File:
        case StoreBackend::JsonFile:
            if (directory.empty()) {
                throw InvalidArgumentError("File store requires a directory");
            }
            break;
        case StoreBackend::Redis:
            if (redisHost.empty()) {
                throw InvalidArgumentError("Redis store requires a host");
            }
            if (redisPort <= 0 || redisPort > 65535) {
                throw InvalidArgumentError("Invalid Redis port: " + std::to_string(redisPort));
            }
            if (redisTimeout <= std::chrono::milliseconds::zero()) {
                throw InvalidArgumentError("Redis timeout must be positive");
            }
            break;
        }
    }

    /**
     * @brief Имя бэкенда → StoreBackend ("memory", "file", "json", "redis")
     * @throws InvalidArgumentError для неизвестного имени
     */
    static StoreBackend parseBackend(const std::string& name) {
        if (name == "memory") return StoreBackend::Memory;
        if (name == "file") return StoreBackend::File;
        if (name == "json") return StoreBackend::JsonFile;
        if (name == "redis") return StoreBackend::Redis;
        throw InvalidArgumentError("Unknown store backend: " + name);
    }

    static std::string backendName(StoreBackend backend) {
        switch (backend) {
        case StoreBackend::Memory: return "memory";
        case StoreBackend::File: return "file";
        case StoreBackend::JsonFile: return "json";
        case StoreBackend::Redis: return "redis";
        }
        return "unknown";
    }
};
