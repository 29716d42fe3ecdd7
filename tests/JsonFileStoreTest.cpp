#include <gtest/gtest.h>
#include <kvcache/stores/PersistentStore.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <string>

/**
 * @brief Тесты для файлового хранилища с JSON-форматом (makeJsonFileStore)
 *
 * Проверяем:
 * - Формат файла <md5>.json: {"value": ..., "expiration": ...}
 * - Истечение TTL
 * - clear() удаляет только свои *.json
 * - Сохранённый null неотличим от отсутствия для has()
 * - Повреждённый файл → CorruptRecordError
 */

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace std::chrono_literals;

class JsonFileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("kvcache_json_" + std::string(
                    ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        now_ = Instant(std::chrono::seconds(1700000000));
        store_ = makeJsonFileStore<json>(root_, [this] { return now_; });
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    json readFile(const std::string& key) const {
        std::ifstream file(store_->pathFor(key));
        return json::parse(file);
    }

    void writeFile(const std::string& key, const std::string& content) const {
        std::ofstream(store_->pathFor(key), std::ios::trunc) << content;
    }

    fs::path root_;
    Instant now_;
    std::unique_ptr<PersistentStore<json>> store_;
};

// ==================== Формат файла ====================

TEST_F(JsonFileStoreTest, FileNameIsDigestWithJsonExtension) {
    store_->set("hello", "world");

    EXPECT_TRUE(fs::exists(root_ / "5d41402abc4b2a76b9719d911017c592.json"));
}

TEST_F(JsonFileStoreTest, FileContentWithoutTtl) {
    store_->set("user", {{"name", "Ann"}, {"age", 30}});

    json content = readFile("user");

    EXPECT_EQ(content["value"]["name"], "Ann");
    EXPECT_EQ(content["value"]["age"], 30);
    EXPECT_TRUE(content["expiration"].is_null());
}

TEST_F(JsonFileStoreTest, FileContentWithTtl) {
    store_->set("key", 1, 60s);

    EXPECT_EQ(readFile("key")["expiration"], 1700000060);
}

TEST_F(JsonFileStoreTest, ReadsHandWrittenFile) {
    writeFile("key", R"({"value": [1, 2, 3], "expiration": null})");

    auto value = store_->get("key");

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), json::array({1, 2, 3}));
}

// ==================== Базовые операции ====================

TEST_F(JsonFileStoreTest, SetGetRemove) {
    EXPECT_TRUE(store_->set("key", {{"nested", {{"deep", true}}}}));

    EXPECT_EQ(store_->get("key").value()["nested"]["deep"], true);
    EXPECT_TRUE(store_->remove("key"));
    EXPECT_FALSE(store_->get("key").has_value());
    EXPECT_FALSE(store_->remove("key"));
}

TEST_F(JsonFileStoreTest, TypedValues) {
    auto store = makeJsonFileStore<std::map<std::string, int>>(root_ / "typed");
    std::map<std::string, int> scores = {{"alice", 3}, {"bob", 5}};

    store->set("scores", scores);

    EXPECT_EQ(store->get("scores").value(), scores);
}

TEST_F(JsonFileStoreTest, StoredNullIsNotHas) {
    store_->set("nothing", nullptr);

    auto value = store_->get("nothing");
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->is_null());
    EXPECT_FALSE(store_->has("nothing"));
}

TEST_F(JsonFileStoreTest, FalsyValuesAreHas) {
    store_->set("zero", 0);
    store_->set("empty", "");
    store_->set("false", false);

    EXPECT_TRUE(store_->has("zero"));
    EXPECT_TRUE(store_->has("empty"));
    EXPECT_TRUE(store_->has("false"));
}

// ==================== TTL ====================

TEST_F(JsonFileStoreTest, ExpiresAfterBoundary) {
    store_->set("key", "value", 10s);

    now_ += 10s;
    EXPECT_TRUE(store_->has("key"));

    now_ += 1s;
    EXPECT_FALSE(store_->get("key").has_value());
    EXPECT_FALSE(fs::exists(store_->pathFor("key")));
}

TEST_F(JsonFileStoreTest, NegativeTtlIsAlreadyExpired) {
    store_->set("key", "value", -1s);

    EXPECT_EQ(store_->get("key", "default"), json("default"));
}

TEST_F(JsonFileStoreTest, HugeTtlKeepsRecordLive) {
    store_->set("key", "value", std::chrono::seconds::max());

    EXPECT_EQ(readFile("key")["expiration"], std::numeric_limits<int64_t>::max());
    EXPECT_EQ(store_->get("key", "default"), json("value"));
}

// ==================== clear ====================

TEST_F(JsonFileStoreTest, ClearRemovesOnlyJsonFiles) {
    store_->set("a", 1);
    store_->set("b", 2);
    std::ofstream(root_ / "readme.txt") << "keep me";
    fs::create_directories(root_ / "sub");
    std::ofstream(root_ / "sub" / "inner.json") << "{}";

    EXPECT_TRUE(store_->clear());

    EXPECT_FALSE(store_->has("a"));
    EXPECT_FALSE(store_->has("b"));
    EXPECT_TRUE(fs::exists(root_ / "readme.txt"));
    EXPECT_TRUE(fs::exists(root_ / "sub" / "inner.json"));
}

TEST_F(JsonFileStoreTest, ClearTwiceReturnsTrue) {
    EXPECT_TRUE(store_->clear());
    EXPECT_TRUE(store_->clear());
    EXPECT_TRUE(fs::is_directory(root_));
}

// ==================== Пакетные операции ====================

TEST_F(JsonFileStoreTest, BatchOperations) {
    EXPECT_TRUE(store_->setMultiple({{"a", 1}, {"b", "two"}}));

    auto result = store_->getMultiple({"a", "missing", "b"}, nullptr);

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0].first, "a");
    EXPECT_EQ(result[0].second, 1);
    EXPECT_EQ(result[1].first, "missing");
    EXPECT_TRUE(result[1].second.is_null());
    EXPECT_EQ(result[2].second, "two");

    EXPECT_TRUE(store_->removeMultiple({"a", "b", "missing"}));
    EXPECT_FALSE(store_->has("a"));
}

// ==================== Повреждённые файлы ====================

TEST_F(JsonFileStoreTest, TamperedFileThrows) {
    store_->set("key", "value");
    writeFile("key", "{\"value\": \"val");

    EXPECT_THROW(store_->get("key"), CorruptRecordError);
}

TEST_F(JsonFileStoreTest, WrongShapeThrows) {
    writeFile("key", R"({"data": "value"})");
    EXPECT_THROW(store_->get("key"), CorruptRecordError);

    writeFile("key", R"(["value", null])");
    EXPECT_THROW(store_->get("key"), CorruptRecordError);
}

TEST_F(JsonFileStoreTest, EmptyKeyThrows) {
    EXPECT_THROW(store_->set("", 1), InvalidKeyError);
    EXPECT_TRUE(fs::is_empty(root_));
}
