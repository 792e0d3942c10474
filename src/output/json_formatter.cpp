#include "output/json_formatter.hpp"
#include "core/time_utils.hpp"
#include "eval/gating.hpp"

namespace vigil::output {

nlohmann::json JsonFormatter::format_event(const TriggerEvent& event) {
    nlohmann::json out{
        {"id", event.id},
        {"alertId", event.alert_id},
        {"ticker", event.ticker},
        {"triggeredAt", format_iso8601(event.triggered_at)},
        {"triggerReason", event.reason},
        {"conditionsMet", event.conditions_met},
        {"priceAtTrigger", event.price_at_trigger},
        {"userAction", std::string(to_string(event.user_action))}
    };

    // Optional context is omitted rather than sent as null
    if (event.volume_at_trigger) {
        out["volumeAtTrigger"] = *event.volume_at_trigger;
    }
    if (event.news_count) {
        out["newsCount"] = *event.news_count;
    }
    if (event.sentiment) {
        out["sentiment"] = *event.sentiment;
    }
    return out;
}

nlohmann::json JsonFormatter::format_batch(
    const Ticker& ticker,
    const std::vector<TriggerEvent>& events
) {
    auto list = nlohmann::json::array();
    for (const auto& event : events) {
        list.push_back(format_event(event));
    }

    return nlohmann::json{
        {"type", "batch"},
        {"timestamp", format_iso8601(std::chrono::system_clock::now())},
        {"ticker", ticker},
        {"count", events.size()},
        {"events", std::move(list)}
    };
}

nlohmann::json JsonFormatter::format_tick_report(const TickReport& report) {
    nlohmann::json skipped = nlohmann::json::object();
    for (const auto& [gate, count] : report.skipped) {
        skipped[std::string(to_string(gate))] = count;
    }

    return nlohmann::json{
        {"type", "tick"},
        {"timestamp", format_iso8601(report.at)},
        {"evaluated", report.evaluated},
        {"triggered", report.triggered},
        {"failures", report.failures},
        {"missingMarket", report.missing_market},
        {"lifecycleChanges", report.lifecycle_changes},
        {"skipped", std::move(skipped)}
    };
}

}  // namespace vigil::output
