#pragma once

#include "alert/alert.hpp"
#include "core/config.hpp"
#include "eval/anomaly_detector.hpp"
#include "eval/condition_evaluator.hpp"
#include "eval/gating.hpp"
#include "eval/sentiment_analyzer.hpp"
#include "market/types.hpp"
#include <optional>

namespace vigil {

/// Outcome of evaluating one alert against one observation
struct AlertEvaluation {
    GateDecision gate{GateDecision::Proceed};
    EvaluationResult result;                 // Empty when gated out
    std::optional<AnomalyReport> anomaly;    // ANOMALY alerts only
    std::optional<TriggerEvent> event;       // Set when the alert fired

    [[nodiscard]] bool triggered() const noexcept {
        return event.has_value();
    }
};

/// Per-alert evaluation: gating, dispatch by alert type, trigger event creation.
/// Holds no mutable state; evaluate() may run concurrently for different alerts.
class AlertEngine {
public:
    /// Build evaluators from configuration
    explicit AlertEngine(const Config& config);

    AlertEngine(
        ConditionEvaluator conditions,
        AnomalyDetector anomaly,
        SentimentAnalyzer sentiment,
        AnomalyConfig default_anomaly,
        double news_trigger_threshold
    );

    /// Evaluate an alert. Does not mutate the alert; the caller applies
    /// record_trigger() for a fired alert.
    /// @param alert Alert to evaluate
    /// @param market Current observation for the alert's ticker
    /// @param news News for the ticker, may be null
    /// @param history Price history for the ticker, may be null
    /// @param now Evaluation instant (gates, event timestamp)
    /// @param triggers Trigger history consulted for the daily cap
    [[nodiscard]] AlertEvaluation evaluate(
        const Alert& alert,
        const MarketObservation& market,
        const NewsContext* news,
        const PriceHistory* history,
        Timestamp now,
        const TriggerHistory& triggers
    ) const;

    [[nodiscard]] const SentimentAnalyzer& sentiment() const noexcept;

private:
    [[nodiscard]] std::optional<double> effective_sentiment(const NewsContext* news) const;

    [[nodiscard]] TriggerEvent make_event(
        const Alert& alert,
        const MarketObservation& market,
        const NewsContext* news,
        const EvaluationResult& result,
        Timestamp now
    ) const;

    ConditionEvaluator conditions_;
    AnomalyDetector anomaly_;
    SentimentAnalyzer sentiment_;
    AnomalyConfig default_anomaly_;
    double news_trigger_threshold_;
};

}  // namespace vigil
