#include <benchmark/benchmark.h>
#include <hdr/hdr_histogram.h>
#include <stdexec/execution.hpp>
#include "beacon.hpp"

#if defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#include <intrin.h>
#else
#include <sched.h>
#include <pthread.h>
#include <x86intrin.h>
#endif

using namespace stdexec;

const double CYCLES_PER_NS = 3.992;

void pin_thread(int cpu_id) {
#if defined(_WIN32) || defined(_WIN64)
    SetThreadAffinityMask(GetCurrentThread(), (static_cast<DWORD_PTR>(1) << cpu_id));
#else
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(cpu_id, &cpuset);
    pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
#endif
}

static void Report(benchmark::State& state, hdr_histogram* hist) {
    state.counters["P50_ns"]   = hdr_value_at_percentile(hist, 50.0) / CYCLES_PER_NS;
    state.counters["P99_ns"]   = hdr_value_at_percentile(hist, 99.0) / CYCLES_PER_NS;
    state.counters["P99.9_ns"] = hdr_value_at_percentile(hist, 99.9) / CYCLES_PER_NS;
}

static void BM_Signal_Dispatch_Latency_HDR(benchmark::State& state) {
    beacon::signal<int> tick;
    hdr_histogram* hist;
    hdr_init(1, 1000000, 3, &hist);

    pin_thread(1);

    tick.add([](int val) {
        benchmark::DoNotOptimize(val);
    });

    for (auto _ : state) {
        for (int i = 0; i < 10000; ++i) {
            uint64_t start = __rdtsc();

            tick.dispatch(42);

            uint64_t end = __rdtsc();
            hdr_record_value(hist, end - start);
        }
    }

    Report(state, hist);
    hdr_close(hist);
}

BENCHMARK(BM_Signal_Dispatch_Latency_HDR)->Unit(benchmark::kMicrosecond);

static void BM_Signal_Memorized_Add_Latency_HDR(benchmark::State& state) {
    beacon::signal<int> ready;
    ready.memorize(true);
    ready.dispatch(42);
    hdr_histogram* hist;
    hdr_init(1, 1000000, 3, &hist);

    pin_thread(1);

    beacon::listener<int> late = then([](int val) {
        benchmark::DoNotOptimize(val);
    });

    for (auto _ : state) {
        for (int i = 0; i < 10000; ++i) {
            uint64_t start = __rdtsc();

            ready.add_once(late);

            uint64_t end = __rdtsc();
            hdr_record_value(hist, end - start);
        }
    }

    Report(state, hist);
    hdr_close(hist);
}

BENCHMARK(BM_Signal_Memorized_Add_Latency_HDR)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
