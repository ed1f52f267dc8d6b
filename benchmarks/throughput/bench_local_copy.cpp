/**
 * @file bench_local_copy.cpp
 * @brief Benchmarks for local-to-local copy through the transfer engine
 *
 * Measures single-file throughput across chunk sizes, many-small-files
 * overhead with and without item parallelism, and paged listing of a
 * large directory.
 */

#include <benchmark/benchmark.h>

#include <kcenon/unified_fs/core/cancellation.h>
#include <kcenon/unified_fs/events/event_bus.h>
#include <kcenon/unified_fs/lister/directory_lister.h>
#include <kcenon/unified_fs/provider/local_provider.h>
#include <kcenon/unified_fs/provider/provider_registry.h>
#include <kcenon/unified_fs/queue/operation_request.h>
#include <kcenon/unified_fs/transfer/transfer_engine.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::unified_fs::benchmark {

namespace {

auto copy_request(const std::filesystem::path& source, const std::filesystem::path& dest)
    -> result<operation_request> {
    return operation_request::builder(operation_kind::copy)
        .add_source(provider_handle::local(), source.string())
        .with_destination(provider_handle::local(), dest.string())
        .with_recursive(true)
        .with_overwrite(overwrite_policy::overwrite)
        .build();
}

}  // namespace

/**
 * @brief Single large file, chunk size swept
 */
static void BM_LocalCopy_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    bench_workspace workspace("single_file");
    auto source = workspace.create_random_file("src/payload.bin", file_size, 42);

    provider_registry registry(std::make_shared<local_provider>());
    event_bus events;
    engine_config config;
    config.chunk_size = chunk_size;
    transfer_engine engine(registry, events, config);

    for (auto _ : state) {
        state.PauseTiming();
        auto dest = workspace.reset_directory("dst");
        auto request = copy_request(source, dest);
        if (!request) {
            state.SkipWithError("Failed to build request");
            return;
        }
        state.ResumeTiming();

        auto outcome = engine.execute(request.value(), cancellation_token{});
        if (outcome.status != operation_status::completed) {
            state.SkipWithError("Copy did not complete");
            return;
        }
        ::benchmark::DoNotOptimize(outcome.bytes_transferred);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["throughput_MB_s"] =
        ::benchmark::Counter(static_cast<double>(file_size) / sizes::MB,
                             ::benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK(BM_LocalCopy_SingleFile)
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::max_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

/**
 * @brief Tree of small files, item parallelism swept
 */
static void BM_LocalCopy_SmallFiles(::benchmark::State& state) {
    const auto parallel = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t file_count = 500;
    constexpr std::size_t file_size = 4 * sizes::KB;

    bench_workspace workspace("small_files");
    auto source = workspace.create_tree("src/tree", 10, file_count, file_size);

    provider_registry registry(std::make_shared<local_provider>());
    event_bus events;
    engine_config config;
    config.max_parallel_items = parallel;
    transfer_engine engine(registry, events, config);

    for (auto _ : state) {
        state.PauseTiming();
        auto dest = workspace.reset_directory("dst");
        auto request = copy_request(source, dest);
        if (!request) {
            state.SkipWithError("Failed to build request");
            return;
        }
        state.ResumeTiming();

        auto outcome = engine.execute(request.value(), cancellation_token{});
        if (outcome.count(item_outcome::succeeded) != file_count) {
            state.SkipWithError("Not every file was copied");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(file_count) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_LocalCopy_SmallFiles)
    ->Arg(1)
    ->Arg(4)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

/**
 * @brief First page of a 10k-entry directory versus the whole listing
 */
static void BM_Lister_LargeDirectory(::benchmark::State& state) {
    const bool whole = state.range(0) != 0;
    constexpr std::size_t entry_count = 10000;

    bench_workspace workspace("lister");
    auto dir = workspace.create_tree("big", 1, entry_count, 0) / "d0";

    provider_registry registry(std::make_shared<local_provider>());
    directory_lister lister(registry);

    for (auto _ : state) {
        auto entries = lister.list(provider_handle::local(), dir.string());
        if (!entries) {
            state.SkipWithError("Listing failed");
            return;
        }
        if (whole) {
            auto all = entries.value().collect();
            ::benchmark::DoNotOptimize(all);
        } else {
            auto page = entries.value().next_page();
            ::benchmark::DoNotOptimize(page);
        }
    }
}
BENCHMARK(BM_Lister_LargeDirectory)
    ->Arg(0)
    ->Arg(1)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::unified_fs::benchmark
