#include <benchmark/benchmark.h>
#include <stdexec/execution.hpp>
#include <tuple>
#include "beacon.hpp"

using namespace stdexec;

static void BM_Signal_Dispatch_Overhead(benchmark::State& state) {
    const size_t SLOTS_NUM = state.range(0);
    beacon::signal<int> tick;
    for (size_t i = 0; i < SLOTS_NUM; ++i) {
        tick.add([](int val) { benchmark::DoNotOptimize(val); }, static_cast<int>(i % 4));
    }

    for (auto _ : state) {
        tick.dispatch(42);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Signal_Dispatch_Overhead)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000)
    ->UseRealTime();

static void BM_Signal_Sender_Dispatch_Overhead(benchmark::State& state) {
    const size_t SLOTS_NUM = state.range(0);
    beacon::signal<int> tick;
    for (size_t i = 0; i < SLOTS_NUM; ++i) {
        tick.add(then([](int val) { benchmark::DoNotOptimize(val); }));
    }

    for (auto _ : state) {
        tick.dispatch(42);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Signal_Sender_Dispatch_Overhead)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000)
    ->UseRealTime();

static void BM_Compound_Join_Overhead(benchmark::State& state) {
    beacon::signal<int> left;
    beacon::signal<int> right;
    beacon::compound_signal joined(left, right);
    joined.unique(false);
    joined.add([](const std::tuple<int>& a, const std::tuple<int>& b) {
        benchmark::DoNotOptimize(std::get<0>(a) + std::get<0>(b));
    });

    for (auto _ : state) {
        left.dispatch(1);
        right.dispatch(2);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Compound_Join_Overhead)->UseRealTime();

static void BM_Signal_Add_Remove(benchmark::State& state) {
    beacon::signal<int> tick;
    for (int i = 0; i < 64; ++i) {
        tick.add([](int) {}, i);
    }
    beacon::listener<int> probe = [](int) {};

    for (auto _ : state) {
        tick.add(probe, 32);
        tick.remove(probe);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Signal_Add_Remove)->UseRealTime();

BENCHMARK_MAIN();
