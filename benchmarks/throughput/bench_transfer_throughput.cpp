/**
 * @file bench_transfer_throughput.cpp
 * @brief Benchmarks for batch transfer throughput
 *
 * Measures end-to-end copy and move throughput of the transfer engine for
 * different worker counts, including resolution and the empty-directory
 * sweep.
 */

#include <benchmark/benchmark.h>

#include <kcenon/file_organizer/engine/transfer_engine.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::file_organizer::benchmark {

/**
 * @brief Copy a batch of files; sources stay in place between iterations
 */
static void BM_Transfer_CopyBatch(::benchmark::State& state) {
    const auto workers = static_cast<std::size_t>(state.range(0));
    const auto file_size = static_cast<std::size_t>(state.range(1));
    constexpr std::size_t file_count = 64;

    source_tree tree("copy");
    auto files = tree.populate(file_count, file_size);

    auto engine = transfer_engine::builder().with_max_workers(workers).build();
    if (!engine) {
        state.SkipWithError("Failed to build engine");
        return;
    }

    transfer_options options;
    options.delete_source = false;

    for (auto _ : state) {
        state.PauseTiming();
        std::error_code ec;
        std::filesystem::remove_all(tree.dest_dir(), ec);
        progress_ledger ledger;
        state.ResumeTiming();

        auto r = engine.value().transfer(files, tree.dest_dir(), ledger, options);
        if (!r) {
            state.SkipWithError(r.error().message.c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(file_count * file_size));
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(file_count));
}

/**
 * @brief Move a batch of files with recursive cleanup
 */
static void BM_Transfer_MoveBatchWithCleanup(::benchmark::State& state) {
    const auto workers = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t file_count = 256;

    source_tree tree("move");
    auto engine = transfer_engine::builder().with_max_workers(workers).build();
    if (!engine) {
        state.SkipWithError("Failed to build engine");
        return;
    }

    transfer_options options;
    options.source_root = tree.source_dir();

    for (auto _ : state) {
        state.PauseTiming();
        tree.reset();
        auto files = tree.populate(file_count, sizes::tiny_file, 16);
        progress_ledger ledger;
        state.ResumeTiming();

        auto r = engine.value().transfer(files, tree.dest_dir(), ledger, options);
        if (!r) {
            state.SkipWithError(r.error().message.c_str());
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(file_count));
}

BENCHMARK(BM_Transfer_CopyBatch)
    ->ArgsProduct({{1, 2, 4, 8},
                   {static_cast<int64_t>(sizes::small_file),
                    static_cast<int64_t>(sizes::medium_file)}})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Transfer_MoveBatchWithCleanup)
    ->Arg(1)
    ->Arg(4)
    ->Arg(8)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::file_organizer::benchmark
