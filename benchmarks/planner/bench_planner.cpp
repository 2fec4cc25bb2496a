/**
 * @file bench_planner.cpp
 * @brief Benchmarks for glob filtering and directory planning
 */

#include <benchmark/benchmark.h>

#include <kcenon/object_batch/core/logging.h>
#include <kcenon/object_batch/planner/batch_planner.h>
#include <kcenon/object_batch/planner/pattern_filter.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::object_batch::benchmark {

/**
 * @brief Include/exclude filtering of relative paths
 */
static void BM_PatternFilter_Filter(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto paths = test_data_generator::generate_paths(count, 42);
    const std::vector<std::string> includes{"*.tar.gz", "dir1/*.log"};
    const std::vector<std::string> excludes{"*.debug.tar.gz"};

    for (auto _ : state) {
        auto kept = pattern_filter::filter(paths, includes, excludes);
        if (!kept) {
            state.SkipWithError("Filter rejected the patterns");
            return;
        }
        ::benchmark::DoNotOptimize(kept.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Worst case for the star backtracking matcher
 */
static void BM_PatternFilter_MatchBacktracking(::benchmark::State& state) {
    const std::string path(static_cast<std::size_t>(state.range(0)), 'a');
    const std::string pattern = "*a*a*a*b";

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(pattern_filter::matches(pattern, path));
    }
}

/**
 * @brief Directory walk, filtering and duplicate detection
 */
static void BM_Planner_UploadDirectory(::benchmark::State& state) {
    get_logger().set_console_enabled(false);

    const auto count = static_cast<std::size_t>(state.range(0));
    temp_tree tree(test_data_generator::generate_paths(count, 7), 16);
    batch_planner planner;

    for (auto _ : state) {
        auto batch = planner.plan_upload_directory(
            tree.root().string(), "s3://bench-bucket/batch/", {"*.tar.gz"}, {"*.debug.tar.gz"});
        if (!batch) {
            state.SkipWithError("Planning failed");
            break;
        }
        ::benchmark::DoNotOptimize(batch.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
    get_logger().set_console_enabled(true);
}

BENCHMARK(BM_PatternFilter_Filter)
    ->Arg(1000)
    ->Arg(10000)
    ->Arg(100000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_PatternFilter_MatchBacktracking)
    ->Arg(64)
    ->Arg(1024)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Planner_UploadDirectory)
    ->Arg(100)
    ->Arg(1000)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::object_batch::benchmark
