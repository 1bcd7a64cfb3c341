#include <benchmark/benchmark.h>
#include "proxy/session_stats.hpp"

using namespace mirage;
using namespace mirage::proxy;

namespace {

HistoryEntry make_entry(int n) {
    HistoryEntry entry;
    entry.id = "fp-" + std::to_string(n);
    entry.timestamp = std::chrono::system_clock::now();
    entry.method = "GET";
    entry.url = "api.example.com/items/" + std::to_string(n);
    entry.target = entry.url;
    entry.status = 200;
    return entry;
}

}  // namespace

// Insertion into a full history (evicts on every call)
static void BM_HistoryAddFull(benchmark::State& state) {
    RequestHistory history;
    for (int i = 0; i < static_cast<int>(history.capacity()); ++i) {
        history.add(make_entry(i));
    }

    auto entry = make_entry(0);
    for (auto _ : state) {
        history.add(entry);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_HistoryAddFull);

// Snapshot copy of a history of the given size
static void BM_HistorySnapshot(benchmark::State& state) {
    RequestHistory history;
    for (int i = 0; i < state.range(0); ++i) {
        history.add(make_entry(i));
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(history.snapshot());
    }
}
BENCHMARK(BM_HistorySnapshot)->Range(10, 1000);

// Counter increments under contention
static void BM_StatisticsIncrement(benchmark::State& state) {
    static Statistics stats;

    for (auto _ : state) {
        stats.increment_hit();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_StatisticsIncrement)->Threads(1)->Threads(4);

BENCHMARK_MAIN();
