#include <benchmark/benchmark.h>
#include "engine/alert_engine.hpp"
#include "engine/trigger_history.hpp"
#include "eval/condition_evaluator.hpp"
#include <iterator>

using namespace vigil;

namespace {

MarketObservation make_market() {
    return MarketObservation{
        .ticker = "SBER",
        .price = 305.0,
        .previous_close = 300.0,
        .volume = 3000.0,
        .average_volume = 1000.0,
        .pe_ratio = 4.2,
        .rsi = 61.0,
        .moving_avg_50 = 290.0,
        .moving_avg_200 = 270.0,
    };
}

std::vector<ConditionGroup> make_groups(std::size_t groups, std::size_t conditions) {
    static const ConditionField kFields[] = {
        ConditionField::Price, ConditionField::PriceChange, ConditionField::VolumeRatio,
        ConditionField::Rsi, ConditionField::MovingAvg50,
    };

    std::vector<ConditionGroup> result;
    for (std::size_t g = 0; g < groups; ++g) {
        ConditionGroup group{.id = "g" + std::to_string(g), .logic = g % 2 ? Logic::Or : Logic::And};
        for (std::size_t c = 0; c < conditions; ++c) {
            group.conditions.push_back(Condition{
                .id = "c" + std::to_string(c),
                .field = kFields[c % std::size(kFields)],
                .op = Operator::GreaterThan,
                .threshold = 1.0
            });
        }
        result.push_back(std::move(group));
    }
    return result;
}

}  // namespace

// Benchmark a single comparison
static void BM_ConditionSingle(benchmark::State& state) {
    ConditionEvaluator evaluator;
    auto market = make_market();
    Condition condition{.id = "c1", .field = ConditionField::Price, .op = Operator::GreaterThan, .threshold = 300.0};

    for (auto _ : state) {
        benchmark::DoNotOptimize(evaluator.evaluate(condition, market, nullptr));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ConditionSingle);

// Benchmark group evaluation with growing rule size
static void BM_ConditionGroups(benchmark::State& state) {
    ConditionEvaluator evaluator;
    auto market = make_market();
    auto groups = make_groups(static_cast<std::size_t>(state.range(0)), 4);

    for (auto _ : state) {
        benchmark::DoNotOptimize(evaluator.evaluate_groups(groups, market, nullptr));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ConditionGroups)->Range(1, 64);

// Benchmark the full per-alert path: gates, dispatch, event creation
static void BM_AlertEngineEvaluate(benchmark::State& state) {
    AlertEngine engine(Config::defaults());
    InMemoryTriggerHistory history;
    auto market = make_market();
    auto now = std::chrono::system_clock::now();

    Alert alert;
    alert.id = "a1";
    alert.ticker = "SBER";
    alert.type = AlertType::MultiCondition;
    alert.condition_groups = make_groups(2, 3);

    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.evaluate(alert, market, nullptr, nullptr, now, history));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AlertEngineEvaluate);
