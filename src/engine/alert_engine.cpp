#include "engine/alert_engine.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace vigil {

namespace {

/// random_generator is not thread-safe, give every worker its own
EventId next_event_id() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

}  // namespace

AlertEngine::AlertEngine(const Config& config)
    : AlertEngine(
          ConditionEvaluator(config.engine.equality_tolerance),
          AnomalyDetector(config.engine.min_history_points),
          SentimentAnalyzer::from_config(config.sentiment),
          config.anomaly,
          config.sentiment.news_trigger_threshold)
{}

AlertEngine::AlertEngine(
    ConditionEvaluator conditions,
    AnomalyDetector anomaly,
    SentimentAnalyzer sentiment,
    AnomalyConfig default_anomaly,
    double news_trigger_threshold
)
    : conditions_(conditions)
    , anomaly_(anomaly)
    , sentiment_(std::move(sentiment))
    , default_anomaly_(default_anomaly)
    , news_trigger_threshold_(news_trigger_threshold)
{}

AlertEvaluation AlertEngine::evaluate(
    const Alert& alert,
    const MarketObservation& market,
    const NewsContext* news,
    const PriceHistory* history,
    Timestamp now,
    const TriggerHistory& triggers
) const {
    AlertEvaluation evaluation;

    evaluation.gate = check_gates(alert, now, triggers);
    if (evaluation.gate != GateDecision::Proceed) {
        spdlog::debug("Alert {} skipped: {}", alert.id, to_string(evaluation.gate));
        return evaluation;
    }

    switch (alert.type) {
        case AlertType::Threshold:
        case AlertType::MultiCondition:
            evaluation.result = conditions_.evaluate_groups(alert.condition_groups, market, news);
            break;

        case AlertType::NewsTriggered: {
            // Score raw articles when the poller did not supply a sentiment
            if (news != nullptr && !news->average_sentiment && !news->articles.empty()) {
                NewsContext scored = *news;
                scored.average_sentiment = sentiment_.average_sentiment(news->articles);
                evaluation.result = evaluate_news_trigger(&scored, news_trigger_threshold_);
            } else {
                evaluation.result = evaluate_news_trigger(news, news_trigger_threshold_);
            }
            break;
        }

        case AlertType::Anomaly: {
            const AnomalyConfig& config = alert.anomaly_config.value_or(default_anomaly_);
            evaluation.anomaly = anomaly_.evaluate(config, market, news, history, now);
            evaluation.result = evaluation.anomaly->result;
            if (evaluation.anomaly->explained_by_news) {
                spdlog::info("Alert {} on {}: anomaly explained by news",
                             alert.id, alert.ticker);
            }
            break;
        }
    }

    if (evaluation.result.triggered) {
        evaluation.event = make_event(alert, market, news, evaluation.result, now);
    }

    return evaluation;
}

const SentimentAnalyzer& AlertEngine::sentiment() const noexcept {
    return sentiment_;
}

std::optional<double> AlertEngine::effective_sentiment(const NewsContext* news) const {
    if (news == nullptr) {
        return std::nullopt;
    }
    if (news->average_sentiment) {
        return news->average_sentiment;
    }
    if (!news->articles.empty()) {
        return sentiment_.average_sentiment(news->articles);
    }
    return std::nullopt;
}

TriggerEvent AlertEngine::make_event(
    const Alert& alert,
    const MarketObservation& market,
    const NewsContext* news,
    const EvaluationResult& result,
    Timestamp now
) const {
    TriggerEvent event;
    event.id = next_event_id();
    event.alert_id = alert.id;
    event.ticker = alert.ticker;
    event.triggered_at = now;
    event.reason = result.reason;
    event.conditions_met = result.conditions_met;
    event.price_at_trigger = market.price;
    event.volume_at_trigger = market.volume;
    if (news != nullptr) {
        event.news_count = news->article_count;
        event.sentiment = effective_sentiment(news);
    }
    event.user_action = UserAction::Pending;
    return event;
}

}  // namespace vigil
