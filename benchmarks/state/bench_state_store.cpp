/**
 * @file bench_state_store.cpp
 * @brief Benchmarks for state serialization, persistence and resume merging
 *
 * The executor saves the whole batch after every status transition, so the
 * save cost per item bounds the per-item overhead of large batches.
 */

#include <benchmark/benchmark.h>

#include <kcenon/object_batch/core/logging.h>
#include <kcenon/object_batch/state/state_store.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::object_batch::benchmark {

static void BM_StateStore_Serialize(::benchmark::State& state) {
    auto batch = test_data_generator::generate_batch(static_cast<std::size_t>(state.range(0)), 42);

    std::size_t bytes = 0;
    for (auto _ : state) {
        auto json = state_store::serialize(batch);
        bytes = json.size();
        ::benchmark::DoNotOptimize(json);
    }

    state.SetBytesProcessed(static_cast<int64_t>(bytes) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_StateStore_Deserialize(::benchmark::State& state) {
    auto batch = test_data_generator::generate_batch(static_cast<std::size_t>(state.range(0)), 42);
    auto json = state_store::serialize(batch);

    for (auto _ : state) {
        auto restored = state_store::deserialize(json);
        if (!restored) {
            state.SkipWithError("Deserialization failed");
            return;
        }
        ::benchmark::DoNotOptimize(restored.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(json.size()) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Atomic save (temp file + rename) of a whole batch
 */
static void BM_StateStore_Save(::benchmark::State& state) {
    get_logger().set_console_enabled(false);

    auto dir = make_temp_directory("object_batch_bench_state");
    state_store store(state_store_config{dir});
    auto batch = test_data_generator::generate_batch(static_cast<std::size_t>(state.range(0)), 42);

    for (auto _ : state) {
        auto saved = store.save(batch);
        if (!saved) {
            state.SkipWithError("Save failed");
            break;
        }
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    get_logger().set_console_enabled(true);
}

static void BM_StateStore_Reconcile(::benchmark::State& state) {
    get_logger().set_console_enabled(false);

    const auto count = static_cast<std::size_t>(state.range(0));
    auto persisted = test_data_generator::generate_batch(count, 42);

    for (auto _ : state) {
        state.PauseTiming();
        auto planned = persisted;
        for (auto& item : planned.items) {
            item.status = item_status::pending;
            item.attempts = 0;
        }
        state.ResumeTiming();

        ::benchmark::DoNotOptimize(state_store::reconcile(planned, persisted));
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
    get_logger().set_console_enabled(true);
}

BENCHMARK(BM_StateStore_Serialize)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_StateStore_Deserialize)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_StateStore_Save)
    ->Arg(100)
    ->Arg(1000)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_StateStore_Reconcile)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::object_batch::benchmark
