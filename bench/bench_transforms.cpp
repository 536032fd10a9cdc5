/**
 * @file  bench/bench_transforms.cpp
 * @brief Google Benchmark suite for the column transforms and the default
 *        feature pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_SimpleMovingAverage / ExponentialMovingAverage
 *   BM_Volatility / Rsi
 *   BM_DefaultPipeline          full reference feature set
 *   BM_ThresholdLabeler
 *
 * Build (CMake):
 *   cmake -DTAFEAT_BENCH=ON ..
 *   cmake --build build --target bench_transforms
 *   ./build/bench_transforms --benchmark_format=json
 *
 * Throughput units: items/second (bars processed).
 */

#include "benchmark/benchmark.h"

#include "tafeat/labels.hpp"
#include "tafeat/pipeline.hpp"
#include "tafeat/transforms.hpp"

#include <cmath>
#include <cstddef>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N synthetic daily closes with a deterministic oscillation around a drift.
static tafeat::PriceSeries make_series(std::size_t n) {
    std::vector<double> closes(n);
    double p = 100.0;
    for (std::size_t i = 0; i < n; ++i) {
        p *= 1.0 + 0.0003 + 0.01 * std::sin(static_cast<double>(i) * 0.37);
        closes[i] = p;
    }
    return tafeat::PriceSeries::from_closes(closes);
}

// ── Column transforms ──────────────────────────────────────────────────────────

static void BM_SimpleMovingAverage(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto ma = tafeat::transforms::simple_moving_average(series, 50);
        benchmark::DoNotOptimize(ma.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SimpleMovingAverage)->Arg(1 << 10)->Arg(1 << 14);

static void BM_ExponentialMovingAverage(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto ema = tafeat::transforms::exponential_moving_average(series, 20);
        benchmark::DoNotOptimize(ema.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ExponentialMovingAverage)->Arg(1 << 10)->Arg(1 << 14);

static void BM_Volatility(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto vol = tafeat::transforms::volatility(series, 20);
        benchmark::DoNotOptimize(vol.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Volatility)->Arg(1 << 10)->Arg(1 << 14);

static void BM_Rsi(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto rsi = tafeat::transforms::rsi(series, 14);
        benchmark::DoNotOptimize(rsi.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Rsi)->Arg(1 << 10)->Arg(1 << 14);

// ── Pipeline and labels ────────────────────────────────────────────────────────

static void BM_DefaultPipeline(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)));
    const tafeat::pipeline::FeaturePipeline pipeline(
        tafeat::config::default_pipeline_config());
    for (auto _ : state) {
        auto table = pipeline.run(series);
        benchmark::DoNotOptimize(table.width());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DefaultPipeline)->Arg(252)->Arg(252 * 20);

static void BM_ThresholdLabeler(benchmark::State& state) {
    const auto series = make_series(static_cast<std::size_t>(state.range(0)));
    const tafeat::labels::ThresholdHorizonLabeler labeler(tafeat::labels::ThresholdHorizonParams{});
    for (auto _ : state) {
        auto labels = labeler.label(series);
        benchmark::DoNotOptimize(labels.values.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ThresholdLabeler)->Arg(252 * 20);

BENCHMARK_MAIN();
