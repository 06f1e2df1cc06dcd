/**
 * @file bench_ledger_contention.cpp
 * @brief Benchmarks for progress ledger updates under contention
 */

#include <benchmark/benchmark.h>

#include <kcenon/file_organizer/core/progress_ledger.h>

#include <string>
#include <vector>

namespace kcenon::file_organizer::benchmark {

namespace {

constexpr int paths_per_thread = 1024;

progress_ledger& shared_ledger() {
    static progress_ledger ledger;
    return ledger;
}

}  // namespace

/**
 * @brief Full per-file lifecycle from many threads against one ledger
 */
static void BM_Ledger_ConcurrentLifecycle(::benchmark::State& state) {
    auto& ledger = shared_ledger();
    if (state.thread_index() == 0) {
        ledger.reset();
    }

    std::vector<std::filesystem::path> paths;
    paths.reserve(paths_per_thread);
    for (int i = 0; i < paths_per_thread; ++i) {
        paths.emplace_back("/bench/" + std::to_string(state.thread_index()) + "/" +
                           std::to_string(i));
    }

    std::size_t next = 0;
    for (auto _ : state) {
        const auto& path = paths[next++ % paths.size()];
        ledger.initialize(path, 4096);
        ledger.update(path, transfer_status::in_progress, 0);
        ledger.update(path, transfer_status::completed, 100, std::nullopt, 4096);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Summary snapshots, as taken by a polling presentation layer
 */
static void BM_Ledger_SummarySnapshot(::benchmark::State& state) {
    progress_ledger ledger;
    for (int i = 0; i < paths_per_thread; ++i) {
        ledger.initialize("/bench/" + std::to_string(i), 4096);
    }

    for (auto _ : state) {
        auto summary = ledger.summary();
        ::benchmark::DoNotOptimize(summary.percent_complete());
    }
}

BENCHMARK(BM_Ledger_ConcurrentLifecycle)->ThreadRange(1, 8)->UseRealTime();
BENCHMARK(BM_Ledger_SummarySnapshot);

}  // namespace kcenon::file_organizer::benchmark
