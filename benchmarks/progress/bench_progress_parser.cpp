/**
 * @file bench_progress_parser.cpp
 * @brief Benchmarks for transport progress line parsing
 */

#include <benchmark/benchmark.h>

#include <kcenon/object_batch/progress/progress_parser.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::object_batch::benchmark {

static void BM_AwsCliParser_Parse(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto lines = test_data_generator::generate_progress_lines(count, uint64_t{512} << 20);
    aws_cli_progress_parser parser;

    for (auto _ : state) {
        for (const auto& line : lines) {
            ::benchmark::DoNotOptimize(parser.parse(line));
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

// Lines that are not progress updates must be rejected quickly
static void BM_AwsCliParser_RejectOtherOutput(::benchmark::State& state) {
    const std::string line =
        "upload: ../support/ZD-145980/application.debug.tar.gz to "
        "s3://gt-logs/zendesk-tickets/ZD-145980/application.debug.tar.gz";
    aws_cli_progress_parser parser;

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(parser.parse(line));
    }
}

static void BM_ByteCountParser_Parse(::benchmark::State& state) {
    byte_count_progress_parser parser;
    const std::string line = "73400320/536870912";

    for (auto _ : state) {
        ::benchmark::DoNotOptimize(parser.parse(line));
    }
}

BENCHMARK(BM_AwsCliParser_Parse)
    ->Arg(100)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_AwsCliParser_RejectOtherOutput);

BENCHMARK(BM_ByteCountParser_Parse);

}  // namespace kcenon::object_batch::benchmark
