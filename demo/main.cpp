#include <kvcache/StoreFactory.hpp>
#include <kvcache/listeners/LoggingListener.hpp>
#include <kvcache/listeners/StatsListener.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

/**
 * @brief Демонстрация хранилищ кэша
 *
 * Сценарии:
 * 1. Базовые операции на выбранном бэкенде (memory / file / json / redis)
 * 2. TTL в файловом хранилище: граница включительная, ленивое удаление
 * 3. Пакетные операции: best-effort против строгого ответа
 * 4. JSON-хранилище: формат файла и clear() только своих файлов
 *
 * Использование: kvcache_demo [memory|file|json|redis]
 */

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace std::chrono_literals;

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void printStats(const StatsListener& stats) {
    std::cout << "\n  Stats: hits=" << stats.hits()
              << ", misses=" << stats.misses()
              << ", sets=" << stats.sets()
              << ", removes=" << stats.removes()
              << ", expirations=" << stats.expirations()
              << ", hit rate=" << std::fixed << std::setprecision(1)
              << stats.hitRate() * 100.0 << "%\n";
}

/**
 * @brief Демо 1: одни и те же операции через ICacheStore
 */
void demoBasicOperations(const StoreConfig& config) {
    printSeparator("Demo 1: Basic Operations (" +
                   StoreConfig::backendName(config.backend) + ")");

    auto store = makeStore<std::string>(config);

    store->set("greeting", "hello");
    store->set("session:42", "token-abc", 60s);

    std::cout << "  get(greeting)      = " << store->get("greeting", "<none>") << "\n";
    std::cout << "  get(session:42)    = " << store->get("session:42", "<none>") << "\n";
    std::cout << "  get(missing)       = " << store->get("missing", "<none>") << "\n";
    std::cout << "  has(greeting)      = " << std::boolalpha << store->has("greeting") << "\n";
    std::cout << "  remove(greeting)   = " << store->remove("greeting") << "\n";
    std::cout << "  remove(greeting)   = " << store->remove("greeting") << "\n";

    try {
        store->set("", "value");
    } catch (const InvalidKeyError& e) {
        std::cout << "  set(\"\")            -> InvalidKeyError: " << e.what() << "\n";
    }

    store->clear();
}

/**
 * @brief Демо 2: истечение TTL на подменённых часах
 *
 * Часы двигаются вручную, чтобы не ждать реальные секунды.
 */
void demoTtlBehavior(const fs::path& root) {
    printSeparator("Demo 2: TTL Behavior (file store)");

    Instant now = ExpirationPolicy::systemNow();
    auto store = makeFileStore<std::string>(root / "ttl", [&now] { return now; });

    auto stats = std::make_shared<StatsListener>();
    store->addListener(stats);
    store->addListener(std::make_shared<LoggingListener>("ttl"));

    store->set("short", "lives 5s", 5s);
    store->set("zero", "lives until the end of this second", 0s);
    store->set("past", "already expired", -1s);
    store->set("forever", "never expires");

    std::cout << "\n  ttl(short) = " << store->timeToLive("short").value().count() << "s\n\n";

    store->get("past");
    now += 5s;
    std::cout << "\n  +5s: short is " << (store->has("short") ? "alive" : "gone") << "\n\n";
    now += 1s;
    std::cout << "\n  +6s: short is " << (store->has("short") ? "alive" : "gone") << "\n\n";

    std::cout << "  removeExpired() removed " << store->removeExpired() << " file(s)\n";

    printStats(*stats);
    store->clear();
}

/**
 * @brief Демо 3: пакетные операции на разных бэкендах
 */
void demoBatchOperations(const fs::path& root) {
    printSeparator("Demo 3: Batch Operations");

    InMemoryStore<int> memory;
    auto files = makeFileStore<int>(root / "batch");

    for (ICacheStore<int>* store : std::vector<ICacheStore<int>*>{&memory, files.get()}) {
        store->setMultiple({{"a", 1}, {"b", 2}});

        std::cout << "  getMultiple(a, x, b) =";
        for (const auto& [key, value] : store->getMultiple({"a", "x", "b"}, 0)) {
            std::cout << " " << key << ":" << value;
        }
        std::cout << "\n  removeMultiple(a, x) = " << std::boolalpha
                  << store->removeMultiple({"a", "x"}) << "\n\n";
    }

    std::cout << "  In-memory store reports the missing key, file store is best-effort.\n";
    files->clear();
}

/**
 * @brief Демо 4: JSON-хранилище рядом с чужими файлами
 */
void demoJsonStore(const fs::path& root) {
    printSeparator("Demo 4: JSON File Store");

    auto store = makeJsonFileStore<json>(root / "json");
    store->set("user:1", {{"name", "Ann"}, {"roles", {"admin", "dev"}}}, 3600s);
    store->set("nothing", nullptr);

    std::cout << "  file: " << store->pathFor("user:1").filename().string() << "\n";
    std::cout << "  user:1 = " << store->get("user:1").value().dump() << "\n";
    std::cout << "  has(nothing) = " << std::boolalpha << store->has("nothing")
              << " (stored null is indistinguishable from absent)\n";

    std::ofstream(root / "json" / "README.txt") << "not a cache record\n";
    store->clear();

    std::cout << "  after clear(): README.txt "
              << (fs::exists(root / "json" / "README.txt") ? "kept" : "removed") << "\n";
}

int main(int argc, char* argv[]) {
    std::cout << "=== kvcache Demo ===\n";

    fs::path root = fs::temp_directory_path() / "kvcache_demo";

    try {
        StoreConfig config;
        if (argc > 1) {
            config.backend = StoreConfig::parseBackend(argv[1]);
        }
        if (config.backend == StoreBackend::File || config.backend == StoreBackend::JsonFile) {
            config.directory = (root / "basic").string();
        }

        demoBasicOperations(config);
        demoTtlBehavior(root);
        demoBatchOperations(root);
        demoJsonStore(root);

        std::cout << "\n" << std::string(60, '=') << "\n";
        std::cout << "  Demo Complete!\n";
        std::cout << std::string(60, '=') << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::error_code ec;
    fs::remove_all(root, ec);
    return 0;
}
