#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <kvcache/StoreFactory.hpp>
#include <filesystem>
#include <iterator>
#include <string>

/**
 * @brief Тесты для StoreConfig и makeStore()
 */

namespace fs = std::filesystem;
using ::testing::Return;

namespace {

class FakeRemoteClient : public IRemoteClient {
public:
    MOCK_METHOD(std::optional<std::string>, get, (const std::string& key), (override));
    MOCK_METHOD(bool, set, (const std::string& key, const std::string& value,
                            std::optional<std::chrono::seconds> expire), (override));
    MOCK_METHOD(int64_t, del, (const std::vector<std::string>& keys), (override));
    MOCK_METHOD(std::vector<std::optional<std::string>>, mget,
                (const std::vector<std::string>& keys), (override));
    MOCK_METHOD(bool, exists, (const std::string& key), (override));
    MOCK_METHOD(bool, flushAll, (), (override));
    MOCK_METHOD(std::vector<bool>, pipelineSet,
                (const std::vector<SetCommand>& commands), (override));
};

fs::path testRoot() {
    return fs::temp_directory_path() /
           ("kvcache_factory_" + std::string(
               ::testing::UnitTest::GetInstance()->current_test_info()->name()));
}

}  // namespace

// ==================== StoreConfig ====================

TEST(StoreConfigTest, DefaultsAreValid) {
    StoreConfig config;

    EXPECT_EQ(config.backend, StoreBackend::Memory);
    EXPECT_EQ(config.redisHost, "127.0.0.1");
    EXPECT_EQ(config.redisPort, 6379);
    EXPECT_NO_THROW(config.validate());
}

TEST(StoreConfigTest, FileBackendRequiresDirectory) {
    StoreConfig config;
    config.backend = StoreBackend::File;
    EXPECT_THROW(config.validate(), InvalidArgumentError);

    config.backend = StoreBackend::JsonFile;
    EXPECT_THROW(config.validate(), InvalidArgumentError);

    config.directory = "/tmp/somewhere";
    EXPECT_NO_THROW(config.validate());
}

TEST(StoreConfigTest, RedisParametersChecked) {
    StoreConfig config;
    config.backend = StoreBackend::Redis;
    EXPECT_NO_THROW(config.validate());

    config.redisPort = 0;
    EXPECT_THROW(config.validate(), InvalidArgumentError);

    config.redisPort = 70000;
    EXPECT_THROW(config.validate(), InvalidArgumentError);

    config.redisPort = 6379;
    config.redisHost.clear();
    EXPECT_THROW(config.validate(), InvalidArgumentError);

    config.redisHost = "localhost";
    config.redisTimeout = std::chrono::milliseconds(0);
    EXPECT_THROW(config.validate(), InvalidArgumentError);
}

TEST(StoreConfigTest, BackendNames) {
    EXPECT_EQ(StoreConfig::parseBackend("memory"), StoreBackend::Memory);
    EXPECT_EQ(StoreConfig::parseBackend("file"), StoreBackend::File);
    EXPECT_EQ(StoreConfig::parseBackend("json"), StoreBackend::JsonFile);
    EXPECT_EQ(StoreConfig::parseBackend("redis"), StoreBackend::Redis);
    EXPECT_THROW(StoreConfig::parseBackend("memcached"), InvalidArgumentError);

    EXPECT_EQ(StoreConfig::backendName(StoreBackend::JsonFile), "json");
    EXPECT_EQ(StoreConfig::backendName(StoreConfig::parseBackend("file")), "file");
}

// ==================== makeStore ====================

TEST(StoreFactoryTest, MemoryStore) {
    auto store = makeStore<int>(StoreConfig{});

    ASSERT_NE(store, nullptr);
    EXPECT_NE(dynamic_cast<InMemoryStore<int>*>(store.get()), nullptr);
    EXPECT_TRUE(store->set("key", 1));
    EXPECT_EQ(store->get("key", 0), 1);
}

TEST(StoreFactoryTest, FileStores) {
    fs::path root = testRoot();
    fs::remove_all(root);

    StoreConfig config;
    config.backend = StoreBackend::File;
    config.directory = (root / "bin").string();
    auto binary = makeStore<std::string>(config);

    config.backend = StoreBackend::JsonFile;
    config.directory = (root / "json").string();
    auto json = makeStore<std::string>(config);

    binary->set("key", "b");
    json->set("key", "j");

    EXPECT_EQ(binary->get("key").value(), "b");
    EXPECT_EQ(json->get("key").value(), "j");
    EXPECT_EQ(std::distance(fs::directory_iterator(root / "bin"), fs::directory_iterator()), 1);
    EXPECT_TRUE(fs::exists(root / "json" / (keyDigest("key") + ".json")));

    fs::remove_all(root);
}

TEST(StoreFactoryTest, RedisStoreWithInjectedClient) {
    auto client = std::make_shared<FakeRemoteClient>();
    EXPECT_CALL(*client, exists("key")).WillOnce(Return(true));

    StoreConfig config;
    config.backend = StoreBackend::Redis;
    auto store = makeStore<std::string>(config, client);

    EXPECT_TRUE(store->has("key"));
}

TEST(StoreFactoryTest, RedisRequiresStringValues) {
    StoreConfig config;
    config.backend = StoreBackend::Redis;

    EXPECT_THROW(makeStore<int>(config, std::make_shared<FakeRemoteClient>()),
                 InvalidArgumentError);
}

TEST(StoreFactoryTest, InvalidConfigThrows) {
    StoreConfig config;
    config.backend = StoreBackend::File;

    EXPECT_THROW(makeStore<int>(config), InvalidArgumentError);
}
