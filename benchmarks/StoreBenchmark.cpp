#include <kvcache/listeners/StatsListener.hpp>
#include <kvcache/serialization/BinaryRecordCodec.hpp>
#include <kvcache/serialization/JsonRecordCodec.hpp>
#include <kvcache/stores/InMemoryStore.hpp>
#include <kvcache/stores/PersistentStore.hpp>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Бенчмарк хранилищ
 *
 * Измеряем:
 * - Throughput set/get (ops/sec) для каждого бэкенда
 * - Стоимость кодеков записи без диска
 * - Влияние слушателей на файловое хранилище
 */

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// ==================== Утилиты ====================

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " ops/sec\n";
}

std::vector<std::string> makeKeys(size_t count) {
    std::vector<std::string> keys;
    keys.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        keys.push_back("key:" + std::to_string(i));
    }
    return keys;
}

// ==================== Хранилища ====================

void benchmarkStore(const std::string& name, ICacheStore<std::string>& store,
                    const std::vector<std::string>& keys) {
    const std::string value(128, 'v');

    double setMs = measureMs([&]() {
        for (const auto& key : keys) {
            store.set(key, value, 3600s);
        }
    });
    printResult(name + " set", setMs, keys.size());

    double getMs = measureMs([&]() {
        for (const auto& key : keys) {
            store.get(key);
        }
    });
    printResult(name + " get (hit)", getMs, keys.size());

    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> dist(0, keys.size() * 2);
    double mixedMs = measureMs([&]() {
        for (size_t i = 0; i < keys.size(); ++i) {
            store.get("key:" + std::to_string(dist(rng)));
        }
    });
    printResult(name + " get (~50% miss)", mixedMs, keys.size());

    double batchMs = measureMs([&]() {
        store.getMultiple(keys, "");
    });
    printResult(name + " getMultiple", batchMs, keys.size());

    store.clear();
}

// ==================== Кодеки ====================

template<typename Codec>
void benchmarkCodec(const std::string& name, size_t operations) {
    Codec codec;
    CacheRecord<std::string> record{std::string(128, 'v'), ExpirationPolicy::systemNow()};

    size_t bytes = 0;
    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < operations; ++i) {
            auto decoded = codec.decode(codec.encode(record));
            bytes += decoded.value.size();
        }
    });
    printResult(name + " encode+decode", timeMs, operations);
    if (bytes == 0) {
        std::cout << "  (unexpected empty payload)\n";
    }
}

// ==================== Слушатели ====================

void benchmarkListenerOverhead(const fs::path& root, const std::vector<std::string>& keys) {
    std::cout << "\n--- Listener overhead (file store) ---\n";

    auto plain = makeFileStore<std::string>(root / "plain");
    benchmarkStore("file, no listeners", *plain, keys);

    auto observed = makeFileStore<std::string>(root / "observed");
    auto stats = std::make_shared<StatsListener>();
    observed->addListener(stats);
    benchmarkStore("file, StatsListener", *observed, keys);

    std::cout << "  hit rate: " << std::setprecision(1) << stats->hitRate() * 100.0 << "%\n";
}

// ==================== Main ====================

int main() {
    const size_t MEMORY_OPS = 1000000;
    const size_t FILE_OPS = 10000;
    const size_t CODEC_OPS = 200000;

    fs::path root = fs::temp_directory_path() / "kvcache_benchmark";

    std::cout << "=== Store Benchmark ===\n\n";

    try {
        std::cout << "--- Codecs ---\n";
        benchmarkCodec<BinaryRecordCodec<std::string>>("binary", CODEC_OPS);
        benchmarkCodec<JsonRecordCodec<std::string>>("json", CODEC_OPS);

        std::cout << "\n--- Stores ---\n";
        InMemoryStore<std::string> memory;
        benchmarkStore("memory", memory, makeKeys(MEMORY_OPS));

        auto files = makeFileStore<std::string>(root / "bin");
        benchmarkStore("file", *files, makeKeys(FILE_OPS));

        auto jsonFiles = makeJsonFileStore<std::string>(root / "json");
        benchmarkStore("json file", *jsonFiles, makeKeys(FILE_OPS));

        benchmarkListenerOverhead(root, makeKeys(FILE_OPS));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::error_code ec;
    fs::remove_all(root, ec);

    std::cout << "\n=== Benchmark complete ===\n";
    return 0;
}
