#include "feed/rule_codec.hpp"
#include "core/time_utils.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace vigil::feed {

using json = nlohmann::json;

namespace {

/// Semantic error in otherwise well-formed JSON
class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string read_string(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        throw CodecError(std::string("missing string field '") + key + "'");
    }
    return j[key].get<std::string>();
}

bool has_value(const json& j, const char* key) {
    return j.contains(key) && !j[key].is_null();
}

std::optional<Timestamp> read_optional_time(const json& j, const char* key) {
    if (!has_value(j, key)) {
        return std::nullopt;
    }
    auto text = j[key].get<std::string>();
    auto parsed = parse_iso8601(text);
    if (!parsed) {
        throw CodecError(std::string("invalid timestamp in '") + key + "': " + text);
    }
    return parsed;
}

template <typename T>
std::optional<T> read_optional(const json& j, const char* key) {
    if (!has_value(j, key)) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

TimeOfDay read_time_of_day(const json& j, const char* key, TimeOfDay fallback) {
    if (!has_value(j, key)) {
        return fallback;
    }
    auto text = j[key].get<std::string>();
    auto parsed = parse_time_of_day(text);
    if (!parsed) {
        throw CodecError(std::string("invalid time of day in '") + key + "': " + text);
    }
    return *parsed;
}

Condition parse_condition(const json& j) {
    Condition condition;
    condition.id = j.value("id", std::string{});
    condition.field = parse_condition_field(j.value("field", std::string{}));
    condition.op = parse_operator(j.value("operator", std::string{}));

    if (!has_value(j, "value")) {
        return condition;
    }
    if (!j["value"].is_number()) {
        // Unknown operators are never matched, so the rest of the rule set still loads
        spdlog::warn("Condition {}: non-numeric value {}, condition disabled", condition.id, j["value"].dump());
        condition.op = Operator::Unknown;
        return condition;
    }
    condition.threshold = j["value"].get<double>();
    return condition;
}

ConditionGroup parse_group(const json& j) {
    ConditionGroup group;
    group.id = j.value("id", std::string{});

    auto logic_name = j.value("logic", std::string("AND"));
    if (auto logic = parse_logic(logic_name)) {
        group.logic = *logic;
    } else {
        spdlog::warn("Condition group {}: unknown logic '{}', using AND", group.id, logic_name);
    }

    if (j.contains("conditions")) {
        for (const auto& c : j["conditions"]) {
            group.conditions.push_back(parse_condition(c));
        }
    }
    return group;
}

AnomalyConfig parse_anomaly_config(const json& j) {
    AnomalyConfig config;
    config.price_change_threshold = j.value("priceChangeThreshold", config.price_change_threshold);
    config.volume_spike_multiplier = j.value("volumeSpikeMultiplier", config.volume_spike_multiplier);
    config.statistical_sigma = j.value("statisticalSigma", config.statistical_sigma);
    config.requires_no_news = j.value("requiresNoNews", config.requires_no_news);
    config.news_lookback = std::chrono::hours(
        j.value("newsLookbackHours", static_cast<int>(config.news_lookback.count())));
    return config;
}

Frequency parse_frequency(const json& j) {
    Frequency frequency;
    frequency.max_per_day = j.value("maxPerDay", frequency.max_per_day);
    frequency.cooldown = std::chrono::minutes(
        j.value("cooldownMinutes", static_cast<int>(frequency.cooldown.count())));
    frequency.batching_enabled = j.value("batchingEnabled", frequency.batching_enabled);
    frequency.batching_window = std::chrono::minutes(
        j.value("batchingWindowMinutes", static_cast<int>(frequency.batching_window.count())));
    return frequency;
}

QuietHours parse_quiet_hours(const json& j) {
    QuietHours quiet;
    quiet.enabled = j.value("enabled", quiet.enabled);
    quiet.start = read_time_of_day(j, "startTime", quiet.start);
    quiet.end = read_time_of_day(j, "endTime", quiet.end);
    quiet.utc_offset = std::chrono::minutes(j.value("utcOffsetMinutes", 0));

    quiet.time_zone = j.value("timeZone", std::string{});
    if (!quiet.time_zone.empty()) {
        auto zone = TimeZone::locate(quiet.time_zone);
        if (zone.is_ok()) {
            quiet.zone = zone.value();
        } else {
            spdlog::warn("{}; using utcOffsetMinutes={}", zone.error(), quiet.utc_offset.count());
        }
    }

    if (j.contains("days")) {
        quiet.days.clear();
        for (const auto& d : j["days"]) {
            int day = d.get<int>();
            if (day < 0 || day > 6) {
                throw CodecError("quiet-hours day out of range: " + std::to_string(day));
            }
            quiet.days.insert(day);
        }
    }
    return quiet;
}

/// @return nullopt when the alert must be skipped (unknown type or status)
std::optional<Alert> parse_alert(const json& j) {
    Alert alert;
    alert.id = read_string(j, "id");
    alert.ticker = read_string(j, "ticker");
    alert.name = j.value("name", alert.id);

    auto type_name = read_string(j, "type");
    auto type = parse_alert_type(type_name);
    if (!type) {
        spdlog::warn("Alert {}: unknown type '{}', skipping", alert.id, type_name);
        return std::nullopt;
    }
    alert.type = *type;

    auto status_name = j.value("status", std::string("ACTIVE"));
    auto status = parse_alert_status(status_name);
    if (!status) {
        spdlog::warn("Alert {}: unknown status '{}', skipping", alert.id, status_name);
        return std::nullopt;
    }
    alert.status = *status;

    auto priority_name = j.value("priority", std::string("MEDIUM"));
    alert.priority = parse_alert_priority(priority_name).value_or(AlertPriority::Medium);

    if (j.contains("conditionGroups")) {
        for (const auto& g : j["conditionGroups"]) {
            alert.condition_groups.push_back(parse_group(g));
        }
    }
    if (has_value(j, "anomalyConfig")) {
        alert.anomaly_config = parse_anomaly_config(j["anomalyConfig"]);
    }
    if (has_value(j, "frequency")) {
        alert.frequency = parse_frequency(j["frequency"]);
    }
    if (has_value(j, "dndSettings")) {
        alert.quiet_hours = parse_quiet_hours(j["dndSettings"]);
    }

    alert.expires_at = read_optional_time(j, "expiresAt");
    alert.snoozed_until = read_optional_time(j, "snoozedUntil");
    alert.last_triggered_at = read_optional_time(j, "lastTriggeredAt");
    alert.triggered_count = j.value("triggeredCount", 0U);

    return alert;
}

MarketObservation parse_market(const Ticker& ticker, const json& j, std::optional<Timestamp> tick_at) {
    if (!j.contains("price") || !j["price"].is_number()) {
        throw CodecError("market." + ticker + ": missing price");
    }

    MarketObservation market;
    market.ticker = ticker;
    market.price = j["price"].get<double>();
    market.previous_close = j.value("previousClose", 0.0);
    market.volume = j.value("volume", 0.0);
    market.average_volume = read_optional<double>(j, "averageVolume");
    market.pe_ratio = read_optional<double>(j, "peRatio");
    market.rsi = read_optional<double>(j, "rsi");
    market.moving_avg_50 = read_optional<double>(j, "movingAvg50");
    market.moving_avg_200 = read_optional<double>(j, "movingAvg200");
    market.market_cap = read_optional<double>(j, "marketCap");
    market.observed_at = read_optional_time(j, "timestamp").value_or(tick_at.value_or(Timestamp{}));
    return market;
}

NewsContext parse_news(const Ticker& ticker, const json& j) {
    NewsContext news;
    news.ticker = ticker;

    if (j.contains("articles")) {
        for (const auto& a : j["articles"]) {
            NewsItem item;
            item.title = a.value("title", std::string{});
            item.summary = a.value("summary", std::string{});
            item.published_at = read_optional_time(a, "publishedAt");
            news.articles.push_back(std::move(item));
        }
    }

    news.article_count = j.value("newsCount", news.articles.size());
    news.average_sentiment = read_optional<double>(j, "averageSentiment");
    return news;
}

PriceHistory parse_history(const json& j) {
    PriceHistory history;
    history.reserve(j.size());
    for (const auto& p : j) {
        PriceHistoryPoint point;
        point.at = read_optional_time(p, "timestamp").value_or(Timestamp{});
        point.price = p.at("price").get<double>();
        point.volume = p.value("volume", 0.0);
        history.push_back(point);
    }
    return history;
}

TickSnapshot parse_tick(const json& j) {
    TickSnapshot tick;
    tick.at = read_optional_time(j, "at");

    if (j.contains("market")) {
        for (const auto& [ticker, m] : j["market"].items()) {
            tick.market.emplace(ticker, parse_market(ticker, m, tick.at));
        }
    }
    if (j.contains("news")) {
        for (const auto& [ticker, n] : j["news"].items()) {
            tick.news.emplace(ticker, parse_news(ticker, n));
        }
    }
    if (j.contains("history")) {
        for (const auto& [ticker, h] : j["history"].items()) {
            tick.history.emplace(ticker, parse_history(h));
        }
    }
    return tick;
}

Result<std::string, std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<std::string, std::string>::Err("Failed to open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return Result<std::string, std::string>::Ok(buffer.str());
}

}  // namespace

Result<std::vector<Alert>, std::string> RuleCodec::parse_alerts(std::string_view json_str) {
    using R = Result<std::vector<Alert>, std::string>;

    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::exception& e) {
        return R::Err(std::string("JSON parse error: ") + e.what());
    }

    const json* list = &j;
    if (j.is_object() && j.contains("alerts")) {
        list = &j["alerts"];
    }
    if (!list->is_array()) {
        return R::Err("Expected an array of alerts");
    }

    std::vector<Alert> alerts;
    alerts.reserve(list->size());

    for (std::size_t i = 0; i < list->size(); ++i) {
        try {
            if (auto alert = parse_alert((*list)[i])) {
                alerts.push_back(std::move(*alert));
            }
        } catch (const json::exception& e) {
            return R::Err("alerts[" + std::to_string(i) + "]: " + e.what());
        } catch (const CodecError& e) {
            return R::Err("alerts[" + std::to_string(i) + "]: " + e.what());
        }
    }

    return R::Ok(std::move(alerts));
}

Result<std::vector<TickSnapshot>, std::string> RuleCodec::parse_feed(std::string_view json_str) {
    using R = Result<std::vector<TickSnapshot>, std::string>;

    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::exception& e) {
        return R::Err(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object() || !j.contains("ticks") || !j["ticks"].is_array()) {
        return R::Err("Missing ticks array in feed");
    }

    const auto& list = j["ticks"];
    std::vector<TickSnapshot> ticks;
    ticks.reserve(list.size());

    for (std::size_t i = 0; i < list.size(); ++i) {
        try {
            ticks.push_back(parse_tick(list[i]));
        } catch (const json::exception& e) {
            return R::Err("ticks[" + std::to_string(i) + "]: " + e.what());
        } catch (const CodecError& e) {
            return R::Err("ticks[" + std::to_string(i) + "]: " + e.what());
        }
    }

    return R::Ok(std::move(ticks));
}

Result<std::vector<Alert>, std::string> RuleCodec::load_alerts(const std::string& path) {
    return read_file(path).and_then(parse_alerts);
}

Result<std::vector<TickSnapshot>, std::string> RuleCodec::load_feed(const std::string& path) {
    return read_file(path).and_then(parse_feed);
}

}  // namespace vigil::feed
