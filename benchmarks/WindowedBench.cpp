#include <benchmark/benchmark.h>
#include "statexpr/Dump.hpp"
#include "statexpr/Report.hpp"
#include "statexpr/Windowed.hpp"
#include "statexpr/util/Logger.hpp"
#include <sstream>
#include <vector>

static void BM_WindowedStream(benchmark::State& state) {
    std::vector<int> data(10000);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<int>(i);
    statexpr::WindowOptions opts;
    opts.step = static_cast<size_t>(state.range(0));
    opts.trim = 3;

    for (auto _ : state) {
        auto stream = statexpr::windowed(statexpr::rangeSource(data), opts);
        size_t batches = 0;
        while (auto b = stream.next()) {
            benchmark::DoNotOptimize(b->front());
            ++batches;
        }
        benchmark::DoNotOptimize(batches);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(data.size()));
}

BENCHMARK(BM_WindowedStream)
    ->Arg(1)
    ->Arg(8)
    ->Arg(64)
    ->Unit(benchmark::kMicrosecond);

static void BM_Report(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    std::vector<statexpr::MapDump> dumps;
    dumps.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        dumps.push_back(statexpr::MapDump{{"sim_insts", static_cast<double>(i + 1)}});
    }

    statexpr::util::logger().setLevel(statexpr::util::LogLevel::Warn);

    statexpr::ReportOptions opts;
    opts.header = false;
    statexpr::Report report({"AC(LV('sim_insts'))", "AMean(LV('sim_insts'))"}, opts);

    for (auto _ : state) {
        report.reset();
        std::ostringstream out;
        auto stats = report.run(statexpr::rangeSource(dumps), out);
        benchmark::DoNotOptimize(stats.rows);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}

BENCHMARK(BM_Report)
    ->Arg(100)
    ->Arg(1000)
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
