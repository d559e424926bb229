#include <benchmark/benchmark.h>
#include "statexpr/Dump.hpp"
#include "statexpr/ExpressionBuilder.hpp"
#include <cmath>
#include <string>
#include <vector>

static std::vector<statexpr::MapDump> makeDumps(size_t n) {
    std::vector<statexpr::MapDump> dumps;
    dumps.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        double insts = 1e6 + 1e5 * std::sin(static_cast<double>(i) * 0.1);
        double cycles = 2e6 + 1e5 * std::cos(static_cast<double>(i) * 0.05);
        dumps.push_back(statexpr::MapDump{{"sim_insts", insts},
                                          {"system.cpu.committedInsts", insts},
                                          {"system.cpu.numCycles", cycles}});
    }
    return dumps;
}

static void BM_BuildExpression(benchmark::State& state) {
    const std::string text = "SlidingHMean(IPC('system.cpu'), length=16) + AC(LV('sim_insts')) / 1e6";
    for (auto _ : state) {
        auto node = statexpr::build(text);
        benchmark::DoNotOptimize(node);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_BuildExpression)->Unit(benchmark::kMicrosecond);

static void BM_EvaluateCumulative(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    auto dumps = makeDumps(n);
    auto node = statexpr::build("GMean(IPC('system.cpu')) * AMean(LV('sim_insts'))");

    for (auto _ : state) {
        node->reset();
        for (const auto& d : dumps) benchmark::DoNotOptimize(node->evaluate(d));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}

BENCHMARK(BM_EvaluateCumulative)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(benchmark::kMicrosecond);

static void BM_EvaluateSliding(benchmark::State& state) {
    const size_t n = 1000;
    auto dumps = makeDumps(n);
    auto node = statexpr::build("SlidingGMean(IPC('system.cpu'), length=" +
                                std::to_string(state.range(0)) + ")");

    for (auto _ : state) {
        node->reset();
        for (const auto& d : dumps) benchmark::DoNotOptimize(node->evaluate(d));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}

BENCHMARK(BM_EvaluateSliding)
    ->Arg(4)
    ->Arg(64)
    ->Arg(512)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
