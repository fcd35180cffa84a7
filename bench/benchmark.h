#pragma once

#include <benchmark/benchmark.h>
#include "RaceTest.h"

class SynchronizationBenchmark {
public:
    static void BM_Mutex(benchmark::State& state) {
        ThreadRaceTest test(state.range(0), state.range(1), false);
        for (auto _ : state) {
            benchmark::DoNotOptimize(test.testWithMutex());
        }
        state.SetItemsProcessed(state.iterations() * state.range(0) * state.range(1));
    }

    static void BM_SpinLock(benchmark::State& state) {
        ThreadRaceTest test(state.range(0), state.range(1), false);
        for (auto _ : state) {
            benchmark::DoNotOptimize(test.testWithSpinLock());
        }
        state.SetItemsProcessed(state.iterations() * state.range(0) * state.range(1));
    }

    static void BM_GuardedInt(benchmark::State& state) {
        ThreadRaceTest test(state.range(0), state.range(1), false);
        for (auto _ : state) {
            benchmark::DoNotOptimize(test.testWithGuardedInt());
        }
        state.SetItemsProcessed(state.iterations() * state.range(0) * state.range(1));
    }

    static void BM_GuardedIntCas(benchmark::State& state) {
        ThreadRaceTest test(state.range(0), state.range(1), false);
        for (auto _ : state) {
            benchmark::DoNotOptimize(test.testWithGuardedCas());
        }
        state.SetItemsProcessed(state.iterations() * state.range(0) * state.range(1));
    }

    // Uncontended shared-lock read
    static void BM_GuardedIntGet(benchmark::State& state) {
        guarded_int::GuardedInt value(42);
        for (auto _ : state) {
            benchmark::DoNotOptimize(value.get());
        }
    }
};

BENCHMARK(SynchronizationBenchmark::BM_Mutex)
    ->Args({4, 1000})
    ->Args({8, 1000})
    ->Args({16, 1000});

BENCHMARK(SynchronizationBenchmark::BM_SpinLock)
    ->Args({4, 1000})
    ->Args({8, 1000})
    ->Args({16, 1000});

BENCHMARK(SynchronizationBenchmark::BM_GuardedInt)
    ->Args({4, 1000})
    ->Args({8, 1000})
    ->Args({16, 1000});

BENCHMARK(SynchronizationBenchmark::BM_GuardedIntCas)
    ->Args({4, 1000})
    ->Args({8, 1000})
    ->Args({16, 1000});

BENCHMARK(SynchronizationBenchmark::BM_GuardedIntGet);
