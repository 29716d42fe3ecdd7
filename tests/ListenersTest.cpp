#include <gtest/gtest.h>
#include <kvcache/listeners/LoggingListener.hpp>
#include <kvcache/listeners/StatsListener.hpp>
#include <kvcache/listeners/StoreEvents.hpp>
#include <kvcache/stores/InMemoryStore.hpp>
#include <kvcache/stores/PersistentStore.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

/**
 * @brief Тесты для слушателей
 *
 * Проверяем:
 * - StatsListener корректно считает статистику
 * - LoggingListener выводит сообщения
 * - Истечение и ошибки I/O файлового хранилища доходят до слушателей
 * - Множественные слушатели и удаление слушателей
 */

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// ==================== StatsListener ====================

TEST(StatsListenerTest, InitiallyZero) {
    StatsListener stats;

    EXPECT_EQ(stats.hits(), 0u);
    EXPECT_EQ(stats.misses(), 0u);
    EXPECT_EQ(stats.sets(), 0u);
    EXPECT_EQ(stats.failedSets(), 0u);
    EXPECT_EQ(stats.removes(), 0u);
    EXPECT_EQ(stats.expirations(), 0u);
    EXPECT_EQ(stats.clears(), 0u);
    EXPECT_EQ(stats.ioErrors(), 0u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.0);
}

TEST(StatsListenerTest, CountsHitsAndMisses) {
    InMemoryStore<int> store;
    auto stats = std::make_shared<StatsListener>();
    store.addListener(stats);

    store.set("key1", 42);
    store.get("key1");      // Hit
    store.get("key1");      // Hit
    store.get("missing");   // Miss

    EXPECT_EQ(stats->hits(), 2u);
    EXPECT_EQ(stats->misses(), 1u);
    EXPECT_EQ(stats->totalRequests(), 3u);
    EXPECT_NEAR(stats->hitRate(), 2.0 / 3.0, 1e-9);
}

TEST(StatsListenerTest, CountsSetsRemovesAndClears) {
    InMemoryStore<int> store;
    auto stats = std::make_shared<StatsListener>();
    store.addListener(stats);

    store.set("a", 1);
    store.set("b", 2);
    store.remove("a");
    store.remove("missing");    // не считается
    store.clear();

    EXPECT_EQ(stats->sets(), 2u);
    EXPECT_EQ(stats->removes(), 1u);
    EXPECT_EQ(stats->clears(), 1u);
}

TEST(StatsListenerTest, Reset) {
    InMemoryStore<int> store;
    auto stats = std::make_shared<StatsListener>();
    store.addListener(stats);

    store.set("key", 1);
    store.get("key");
    stats->reset();

    EXPECT_EQ(stats->sets(), 0u);
    EXPECT_EQ(stats->hits(), 0u);
    EXPECT_DOUBLE_EQ(stats->hitRate(), 0.0);
}

// ==================== LoggingListener ====================

TEST(LoggingListenerTest, LogsOperations) {
    std::ostringstream output;
    InMemoryStore<int> store;
    store.addListener(std::make_shared<LoggingListener>("mem", output));

    store.set("key", 1);
    store.get("key");
    store.get("other");
    store.remove("key");
    store.remove("key");
    store.clear();

    EXPECT_EQ(output.str(),
              "[mem] SET: key\n"
              "[mem] HIT: key\n"
              "[mem] MISS: other\n"
              "[mem] REMOVE: key\n"
              "[mem] REMOVE: key (not found)\n"
              "[mem] CLEAR\n");
}

TEST(LoggingListenerTest, DefaultPrefix) {
    std::ostringstream output;
    LoggingListener logger("Store", output);

    logger.onExpire("session");
    logger.onSet("key", false);
    logger.onIoError("/tmp/x", "Permission denied");

    EXPECT_EQ(output.str(),
              "[Store] EXPIRE: session\n"
              "[Store] SET: key (failed)\n"
              "[Store] IO ERROR: /tmp/x: Permission denied\n");
}

// ==================== Файловое хранилище ====================

class FileStoreListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("kvcache_listen_" + std::string(
                    ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        now_ = Instant(std::chrono::seconds(1700000000));
        store_ = makeFileStore<int>(root_, [this] { return now_; });
        stats_ = std::make_shared<StatsListener>();
        store_->addListener(stats_);
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    Instant now_;
    std::unique_ptr<PersistentStore<int>> store_;
    std::shared_ptr<StatsListener> stats_;
};

TEST_F(FileStoreListenerTest, ExpirationIsReported) {
    store_->set("key", 1, 5s);
    now_ += 6s;

    store_->get("key");

    EXPECT_EQ(stats_->expirations(), 1u);
    EXPECT_EQ(stats_->misses(), 1u);
    EXPECT_EQ(stats_->removes(), 1u);
}

TEST_F(FileStoreListenerTest, CorruptFileDuringSweepIsReported) {
    std::ofstream(store_->pathFor("broken"), std::ios::binary) << "garbage";

    EXPECT_EQ(store_->removeExpired(), 0u);
    EXPECT_EQ(stats_->ioErrors(), 1u);
}

TEST_F(FileStoreListenerTest, FailedWriteIsReported) {
    // Каталог на месте файла записи: open(O_WRONLY) завершится ошибкой
    fs::create_directory(store_->pathFor("key"));

    EXPECT_FALSE(store_->set("key", 1));
    EXPECT_EQ(stats_->failedSets(), 1u);
    EXPECT_EQ(stats_->ioErrors(), 1u);
}

TEST_F(FileStoreListenerTest, ClearIsReported) {
    store_->clear();
    EXPECT_EQ(stats_->clears(), 1u);
}

// ==================== Множественные слушатели ====================

TEST(MultipleListenersTest, AllListenersNotified) {
    std::ostringstream output;
    InMemoryStore<int> store;
    auto stats = std::make_shared<StatsListener>();
    store.addListener(stats);
    store.addListener(std::make_shared<LoggingListener>("mem", output));

    store.set("key", 1);

    EXPECT_EQ(stats->sets(), 1u);
    EXPECT_EQ(output.str(), "[mem] SET: key\n");
}

TEST(MultipleListenersTest, RemoveListener) {
    InMemoryStore<int> store;
    auto stats = std::make_shared<StatsListener>();
    store.addListener(stats);

    store.set("a", 1);
    store.removeListener(stats);
    store.set("b", 2);

    EXPECT_EQ(stats->sets(), 1u);
}

TEST(StoreEventsTest, IgnoresNullListener) {
    StoreEvents events;
    events.addListener(nullptr);

    EXPECT_EQ(events.listenerCount(), 0u);
    events.hit("key");
}
