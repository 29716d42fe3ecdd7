#pragma once

#include <kvcache/Errors.hpp>
#include <kvcache/ICacheStore.hpp>
#include <kvcache/expiration/ExpirationPolicy.hpp>
#include <kvcache/listeners/StoreEvents.hpp>
#include <kvcache/serialization/BinaryRecordCodec.hpp>
#include <kvcache/serialization/IRecordCodec.hpp>
#include <kvcache/serialization/JsonRecordCodec.hpp>
#include <kvcache/storage/RecordDirectory.hpp>
#include <kvcache/validation/KeyValidator.hpp>
#include <filesystem>
#include <memory>
#include <string>

/**
 * @brief Что удаляет clear()
 */
enum class ClearScope {
    WholeTree,      ///< Всё содержимое корня рекурсивно (бинарный вариант)
    OwnFilesOnly    ///< Только файлы с расширением кодека в корне (JSON-вариант)
};

/**
 * @brief Файловое хранилище: один файл на ключ
 * @tparam V Тип значения
 *
 * Архитектура:
 * - Путь к файлу: root / md5(key) + расширение кодека (RecordDirectory)
 * - Формат файла: инжектируемый кодек (BinaryRecordCodec / JsonRecordCodec)
 * - Истечение: ленивое, при чтении (ExpirationPolicy)
 * - Запись: файл целиком под flock(LOCK_EX)
 *
 * Особенности поведения:
 * - повреждённый файл при чтении: CorruptRecordError, а не default;
 * - пакетные setMultiple/removeMultiple: best-effort, всегда true;
 * - has() == «get() вернул не-null», сохранённый JSON null неотличим от отсутствия;
 * - clear() всегда true, ошибки удаления уходят только слушателям.
 *
 * @code
 *   auto store = makeJsonFileStore<nlohmann::json>("/var/cache/app");
 *   store->set("user:1", {{"name", "Ann"}}, std::chrono::seconds(60));
 *   auto user = store->get("user:1");
 * @endcode
 */
template<typename V>
class PersistentStore : public ICacheStore<V> {
public:
    using typename ICacheStore<V>::Entries;

    /**
     * @brief Конструктор
     * @param root Корневой каталог (создаётся, если отсутствует)
     * @param codec Кодек записи
     * @param clearScope Что удалять в clear()
     * @param now Источник времени (по умолчанию системные часы)
     *
     * @throws InvalidArgumentError если codec == nullptr или root пустой
     * @throws std::filesystem::filesystem_error если каталог не создаётся
     */
    PersistentStore(std::filesystem::path root,
                    std::shared_ptr<IRecordCodec<V>> codec,
                    ClearScope clearScope,
                    NowFn now = &ExpirationPolicy::systemNow)
        : codec_(requireCodec(std::move(codec)))
        , clearScope_(clearScope)
        , now_(std::move(now))
        , directory_(std::move(root))
    {
        if (!now_) {
            now_ = &ExpirationPolicy::systemNow;
        }
    }

    /**
     * @brief Получить значение
     *
     * Логика:
     * 1. Нет файла: nullopt
     * 2. Читаем и декодируем файл (ошибка декодирования пробрасывается)
     * 3. Запись жива, возвращаем значение; истекла, удаляем файл и возвращаем nullopt
     */
    std::optional<V> get(const std::string& key) override {
        KeyValidator::validate(key);

        auto path = directory_.locate(key, codec_->extension());
        if (!directory_.exists(path)) {
            events_.miss(key);
            return std::nullopt;
        }

        CacheRecord<V> record = codec_->decode(directory_.read(path));
        if (ExpirationPolicy::isLive(record, now_())) {
            events_.hit(key);
            return std::move(record.value);
        }

        events_.expire(key);
        remove(key);
        events_.miss(key);
        return std::nullopt;
    }

    V get(const std::string& key, const V& defaultValue) override {
        auto value = get(key);
        if (!value.has_value()) {
            return defaultValue;
        }
        return std::move(value.value());
    }

    /**
     * @brief Записать значение
     * @return true, если файл записан целиком
     *
     * Отрицательный TTL не отвергается: запись создаётся уже истёкшей.
     */
    bool set(const std::string& key, const V& value, Ttl ttl = std::nullopt) override {
        KeyValidator::validate(key);

        CacheRecord<V> record{value, ExpirationPolicy::absoluteExpiry(ttl, now_())};
        auto path = directory_.locate(key, codec_->extension());

        std::error_code ec = directory_.writeExclusive(path, codec_->encode(record));
        if (ec) {
            events_.ioError(path.string(), ec.message());
        }
        events_.set(key, !ec);
        return !ec;
    }

    /**
     * @brief Удалить значение
     * @return false, если файла не было или его не удалось удалить
     */
    bool remove(const std::string& key) override {
        KeyValidator::validate(key);

        auto path = directory_.locate(key, codec_->extension());
        if (!directory_.exists(path)) {
            events_.remove(key, false);
            return false;
        }

        std::error_code ec = directory_.remove(path);
        if (ec) {
            events_.ioError(path.string(), ec.message());
        }
        events_.remove(key, !ec);
        return !ec;
    }

    /**
     * @brief Удалить все записи и пересоздать корень
     * @return Всегда true
     */
    bool clear() override {
        std::vector<IoFailure> failures = clearScope_ == ClearScope::WholeTree
            ? directory_.removeTree()
            : directory_.removeFilesWithExtension(codec_->extension());

        for (const auto& failure : failures) {
            events_.ioError(failure.path.string(), failure.error.message());
        }

        directory_.recreate();
        events_.clear();
        return true;
    }

    bool has(const std::string& key) override {
        KeyValidator::validate(key);

        auto value = get(key);
        return value.has_value() && !NullSentinel<V>::isNull(value.value());
    }

    Entries getMultiple(const std::vector<std::string>& keys,
                        const V& defaultValue) override {
        KeyValidator::validateAll(keys);

        Entries result;
        result.reserve(keys.size());
        for (const auto& key : keys) {
            result.emplace_back(key, get(key, defaultValue));
        }
        return result;
    }

    /**
     * @brief Записать пакет: каждая запись независимо
     * @return true после прохода по всем записям, независимо от их результата
     */
    bool setMultiple(const Entries& entries, Ttl ttl = std::nullopt) override {
        for (const auto& entry : entries) {
            KeyValidator::validate(entry.first);
        }

        for (const auto& [key, value] : entries) {
            set(key, value, ttl);
        }
        return true;
    }

    /**
     * @brief Удалить пакет: каждый ключ независимо
     * @return true после прохода по всем ключам, независимо от их результата
     */
    bool removeMultiple(const std::vector<std::string>& keys) override {
        KeyValidator::validateAll(keys);

        for (const auto& key : keys) {
            remove(key);
        }
        return true;
    }

    // ==================== Дополнительные методы ====================

    /**
     * @brief Оставшееся время жизни ключа
     * @return nullopt если ключа нет, запись истекла или бессрочная
     */
    std::optional<std::chrono::seconds> timeToLive(const std::string& key) {
        KeyValidator::validate(key);

        auto path = directory_.locate(key, codec_->extension());
        if (!directory_.exists(path)) {
            return std::nullopt;
        }

        CacheRecord<V> record = codec_->decode(directory_.read(path));
        Instant now = now_();
        if (!ExpirationPolicy::isLive(record, now)) {
            events_.expire(key);
            remove(key);
            return std::nullopt;
        }
        return ExpirationPolicy::remaining(record, now);
    }

    /**
     * @brief Удалить все просроченные файлы
     * @return Количество удалённых записей
     *
     * Повреждённые файлы не трогаются: о них сообщается слушателям.
     * Полезно для периодической очистки каталога, куда давно не обращались.
     */
    size_t removeExpired() {
        size_t count = 0;
        Instant now = now_();

        for (const auto& path : directory_.listRecordFiles(codec_->extension())) {
            CacheRecord<V> record;
            try {
                record = codec_->decode(directory_.read(path));
            } catch (const CorruptRecordError& e) {
                events_.ioError(path.string(), e.what());
                continue;
            }

            if (ExpirationPolicy::isLive(record, now)) {
                continue;
            }

            std::error_code ec = directory_.remove(path);
            if (ec) {
                events_.ioError(path.string(), ec.message());
            } else {
                ++count;
            }
        }
        return count;
    }

    const std::filesystem::path& root() const {
        return directory_.root();
    }

    /**
     * @brief Путь к файлу записи ключа (для диагностики)
     */
    std::filesystem::path pathFor(const std::string& key) const {
        KeyValidator::validate(key);
        return directory_.locate(key, codec_->extension());
    }

    // ==================== Управление слушателями ====================

    void addListener(std::shared_ptr<IStoreListener> listener) {
        events_.addListener(std::move(listener));
    }

    void removeListener(const std::shared_ptr<IStoreListener>& listener) {
        events_.removeListener(listener);
    }

private:
    /**
     * @brief Проверка кодека до создания каталога (codec_ инициализируется первым)
     */
    static std::shared_ptr<IRecordCodec<V>> requireCodec(
            std::shared_ptr<IRecordCodec<V>> codec) {
        if (!codec) {
            throw InvalidArgumentError("Record codec cannot be null");
        }
        return codec;
    }

    std::shared_ptr<IRecordCodec<V>> codec_;
    ClearScope clearScope_;
    NowFn now_;
    RecordDirectory directory_;
    StoreEvents events_;
};

// ==================== Фабрики вариантов ====================

/**
 * @brief Хранилище с бинарным форматом: файлы без расширения,
 *        clear() удаляет всё дерево под корнем
 */
template<typename V>
std::unique_ptr<PersistentStore<V>> makeFileStore(
        std::filesystem::path root,
        NowFn now = &ExpirationPolicy::systemNow) {
    return std::make_unique<PersistentStore<V>>(
        std::move(root),
        std::make_shared<BinaryRecordCodec<V>>(),
        ClearScope::WholeTree,
        std::move(now));
}

/**
 * @brief Хранилище с JSON-форматом: файлы *.json,
 *        clear() удаляет только их
 */
template<typename V>
std::unique_ptr<PersistentStore<V>> makeJsonFileStore(
        std::filesystem::path root,
        NowFn now = &ExpirationPolicy::systemNow) {
    return std::make_unique<PersistentStore<V>>(
        std::move(root),
        std::make_shared<JsonRecordCodec<V>>(),
        ClearScope::OwnFilesOnly,
        std::move(now));
}
