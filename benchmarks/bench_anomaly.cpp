#include <benchmark/benchmark.h>
#include "eval/anomaly_detector.hpp"
#include <random>

using namespace vigil;

namespace {

PriceHistory make_history(std::size_t points) {
    std::mt19937 rng(42);
    std::normal_distribution<double> noise(0.0, 1.0);

    PriceHistory history;
    history.reserve(points);
    auto at = std::chrono::system_clock::now() - std::chrono::hours(points);
    for (std::size_t i = 0; i < points; ++i) {
        history.push_back(PriceHistoryPoint{.at = at, .price = 100.0 + noise(rng), .volume = 1000.0});
        at += std::chrono::hours(1);
    }
    return history;
}

}  // namespace

// Benchmark statistics over a rolling window
static void BM_PriceStatistics(benchmark::State& state) {
    auto history = make_history(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        benchmark::DoNotOptimize(compute_price_statistics(history));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PriceStatistics)->Range(20, 4096);

// Benchmark the full detector with every signal enabled
static void BM_AnomalyEvaluate(benchmark::State& state) {
    AnomalyDetector detector;
    AnomalyConfig config;
    auto history = make_history(static_cast<std::size_t>(state.range(0)));
    auto now = std::chrono::system_clock::now();

    MarketObservation market{
        .ticker = "LKOH",
        .price = 110.0,
        .previous_close = 100.0,
        .volume = 6000.0,
        .average_volume = 1000.0,
    };

    for (auto _ : state) {
        benchmark::DoNotOptimize(detector.evaluate(config, market, nullptr, &history, now));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AnomalyEvaluate)->Range(20, 4096);
