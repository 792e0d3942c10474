#include <gtest/gtest.h>
#include "feed/rule_codec.hpp"
#include <cstdio>
#include <fstream>

using namespace vigil;
using namespace vigil::feed;
using namespace std::chrono;

// ============================================================================
// Alert rules
// ============================================================================

TEST(RuleCodecTest, ParsesFullAlert) {
    const char* json = R"({
        "alerts": [{
            "id": "a1",
            "ticker": "SBER",
            "name": "SBER breakout",
            "type": "MULTI_CONDITION",
            "priority": "HIGH",
            "status": "SNOOZED",
            "conditionGroups": [{
                "id": "g1",
                "logic": "OR",
                "conditions": [
                    {"id": "c1", "field": "PRICE", "operator": "GREATER_THAN", "value": 300.5},
                    {"id": "c2", "field": "RSI", "operator": "LESS_THAN_EQUAL", "value": 30}
                ]
            }],
            "frequency": {
                "maxPerDay": 5,
                "cooldownMinutes": 10,
                "batchingEnabled": false,
                "batchingWindowMinutes": 30
            },
            "dndSettings": {
                "enabled": true,
                "startTime": "23:00",
                "endTime": "07:30",
                "days": [1, 2, 3],
                "utcOffsetMinutes": 180
            },
            "expiresAt": "2024-02-01T00:00:00Z",
            "snoozedUntil": "2024-01-17T13:00:00Z",
            "lastTriggeredAt": "2024-01-16T10:00:00Z",
            "triggeredCount": 4
        }]
    })";

    auto result = RuleCodec::parse_alerts(json);
    ASSERT_TRUE(result.is_ok()) << result.error();
    ASSERT_EQ(result.value().size(), 1u);

    const auto& alert = result.value()[0];
    EXPECT_EQ(alert.id, "a1");
    EXPECT_EQ(alert.ticker, "SBER");
    EXPECT_EQ(alert.name, "SBER breakout");
    EXPECT_EQ(alert.type, AlertType::MultiCondition);
    EXPECT_EQ(alert.priority, AlertPriority::High);
    EXPECT_EQ(alert.status, AlertStatus::Snoozed);

    ASSERT_EQ(alert.condition_groups.size(), 1u);
    const auto& group = alert.condition_groups[0];
    EXPECT_EQ(group.logic, Logic::Or);
    ASSERT_EQ(group.conditions.size(), 2u);
    EXPECT_EQ(group.conditions[0].field, ConditionField::Price);
    EXPECT_EQ(group.conditions[0].op, Operator::GreaterThan);
    EXPECT_DOUBLE_EQ(group.conditions[0].threshold, 300.5);
    EXPECT_EQ(group.conditions[1].field, ConditionField::Rsi);
    EXPECT_EQ(group.conditions[1].op, Operator::LessEqual);

    EXPECT_EQ(alert.frequency.max_per_day, 5);
    EXPECT_EQ(alert.frequency.cooldown, minutes(10));
    EXPECT_FALSE(alert.frequency.batching_enabled);
    EXPECT_EQ(alert.frequency.batching_window, minutes(30));

    EXPECT_TRUE(alert.quiet_hours.enabled);
    EXPECT_EQ(alert.quiet_hours.start, (TimeOfDay{23, 0}));
    EXPECT_EQ(alert.quiet_hours.end, (TimeOfDay{7, 30}));
    EXPECT_EQ(alert.quiet_hours.days, (std::set<int>{1, 2, 3}));
    EXPECT_EQ(alert.quiet_hours.utc_offset, minutes(180));

    EXPECT_EQ(alert.expires_at, parse_iso8601("2024-02-01T00:00:00Z"));
    EXPECT_EQ(alert.snoozed_until, parse_iso8601("2024-01-17T13:00:00Z"));
    EXPECT_EQ(alert.last_triggered_at, parse_iso8601("2024-01-16T10:00:00Z"));
    EXPECT_EQ(alert.triggered_count, 4u);
}

TEST(RuleCodecTest, AppliesDefaults) {
    auto result = RuleCodec::parse_alerts(R"([{"id": "a1", "ticker": "GAZP", "type": "THRESHOLD"}])");
    ASSERT_TRUE(result.is_ok()) << result.error();

    const auto& alert = result.value()[0];
    EXPECT_EQ(alert.name, "a1");
    EXPECT_EQ(alert.status, AlertStatus::Active);
    EXPECT_EQ(alert.priority, AlertPriority::Medium);
    EXPECT_EQ(alert.frequency.max_per_day, 3);
    EXPECT_EQ(alert.frequency.cooldown, minutes(60));
    EXPECT_TRUE(alert.frequency.batching_enabled);
    EXPECT_FALSE(alert.quiet_hours.enabled);
    EXPECT_FALSE(alert.anomaly_config.has_value());
    EXPECT_FALSE(alert.expires_at.has_value());
}

TEST(RuleCodecTest, ParsesAnomalyConfig) {
    auto result = RuleCodec::parse_alerts(R"([{
        "id": "a1", "ticker": "YNDX", "type": "ANOMALY",
        "anomalyConfig": {
            "priceChangeThreshold": 8,
            "volumeSpikeMultiplier": 3.5,
            "statisticalSigma": 2.5,
            "requiresNoNews": false
        }
    }])");
    ASSERT_TRUE(result.is_ok()) << result.error();

    const auto& config = result.value()[0].anomaly_config;
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->price_change_threshold, 8.0);
    EXPECT_DOUBLE_EQ(config->volume_spike_multiplier, 3.5);
    EXPECT_DOUBLE_EQ(config->statistical_sigma, 2.5);
    EXPECT_FALSE(config->requires_no_news);
    EXPECT_EQ(config->news_lookback, hours(24));
}

TEST(RuleCodecTest, UnknownConditionValuesAreKept) {
    auto result = RuleCodec::parse_alerts(R"([{
        "id": "a1", "ticker": "SBER", "type": "THRESHOLD",
        "conditionGroups": [{"id": "g1", "logic": "XOR", "conditions": [
            {"id": "c1", "field": "DIVIDEND_YIELD", "operator": "BETWEEN", "value": 1}
        ]}]
    }])");
    ASSERT_TRUE(result.is_ok()) << result.error();

    const auto& group = result.value()[0].condition_groups[0];
    EXPECT_EQ(group.logic, Logic::And);
    EXPECT_EQ(group.conditions[0].field, ConditionField::Unknown);
    EXPECT_EQ(group.conditions[0].op, Operator::Unknown);
}

TEST(RuleCodecTest, NonNumericValueDisablesOnlyThatCondition) {
    auto result = RuleCodec::parse_alerts(R"([
        {"id": "a1", "ticker": "SBER", "type": "THRESHOLD",
         "conditionGroups": [{"id": "g1", "conditions": [
            {"id": "c1", "field": "PRICE", "operator": "GREATER_THAN", "value": "300"},
            {"id": "c2", "field": "RSI", "operator": "LESS_THAN", "value": 30}
         ]}]},
        {"id": "a2", "ticker": "GAZP", "type": "THRESHOLD"}
    ])");
    ASSERT_TRUE(result.is_ok()) << result.error();
    ASSERT_EQ(result.value().size(), 2u);

    const auto& conditions = result.value()[0].condition_groups[0].conditions;
    EXPECT_EQ(conditions[0].field, ConditionField::Price);
    EXPECT_EQ(conditions[0].op, Operator::Unknown);
    EXPECT_EQ(conditions[1].op, Operator::LessThan);
    EXPECT_DOUBLE_EQ(conditions[1].threshold, 30.0);
}

TEST(RuleCodecTest, ResolvesQuietHoursTimeZone) {
    if (TimeZone::locate("America/New_York").is_err()) {
        GTEST_SKIP() << "zoneinfo database not available";
    }
    auto result = RuleCodec::parse_alerts(R"([{"id": "a1", "ticker": "SBER", "type": "THRESHOLD",
        "dndSettings": {"enabled": true, "timeZone": "America/New_York", "utcOffsetMinutes": 180}}])");
    ASSERT_TRUE(result.is_ok()) << result.error();

    const auto& quiet = result.value()[0].quiet_hours;
    EXPECT_EQ(quiet.time_zone, "America/New_York");
    ASSERT_NE(quiet.zone, nullptr);
    EXPECT_EQ(quiet.zone->name(), "America/New_York");
}

TEST(RuleCodecTest, UnknownTimeZoneFallsBackToOffset) {
    auto result = RuleCodec::parse_alerts(R"([{"id": "a1", "ticker": "SBER", "type": "THRESHOLD",
        "dndSettings": {"enabled": true, "timeZone": "Mars/Olympus_Mons", "utcOffsetMinutes": 180}}])");
    ASSERT_TRUE(result.is_ok()) << result.error();

    const auto& quiet = result.value()[0].quiet_hours;
    EXPECT_EQ(quiet.zone, nullptr);
    EXPECT_EQ(quiet.utc_offset, minutes(180));
}

TEST(RuleCodecTest, SkipsUnknownTypeOrStatus) {
    auto result = RuleCodec::parse_alerts(R"([
        {"id": "a1", "ticker": "SBER", "type": "PRICE_TARGET"},
        {"id": "a2", "ticker": "SBER", "type": "THRESHOLD", "status": "PAUSED"},
        {"id": "a3", "ticker": "SBER", "type": "THRESHOLD"}
    ])");
    ASSERT_TRUE(result.is_ok()) << result.error();

    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].id, "a3");
}

TEST(RuleCodecTest, MissingRequiredFieldFails) {
    auto result = RuleCodec::parse_alerts(R"([
        {"id": "a1", "ticker": "SBER", "type": "THRESHOLD"},
        {"id": "a2", "type": "THRESHOLD"}
    ])");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().rfind("alerts[1]:", 0), 0u);
    EXPECT_NE(result.error().find("ticker"), std::string::npos);
}

TEST(RuleCodecTest, InvalidQuietHoursFail) {
    auto bad_time = RuleCodec::parse_alerts(R"([{"id": "a1", "ticker": "SBER", "type": "THRESHOLD",
        "dndSettings": {"enabled": true, "startTime": "25:00", "endTime": "07:00"}}])");
    EXPECT_TRUE(bad_time.is_err());

    auto bad_day = RuleCodec::parse_alerts(R"([{"id": "a1", "ticker": "SBER", "type": "THRESHOLD",
        "dndSettings": {"enabled": true, "days": [7]}}])");
    EXPECT_TRUE(bad_day.is_err());
}

TEST(RuleCodecTest, InvalidTimestampFails) {
    auto result = RuleCodec::parse_alerts(R"([{"id": "a1", "ticker": "SBER", "type": "THRESHOLD",
        "expiresAt": "next tuesday"}])");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("expiresAt"), std::string::npos);
}

TEST(RuleCodecTest, MalformedJsonFails) {
    auto result = RuleCodec::parse_alerts("{\"alerts\": [");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().rfind("JSON parse error:", 0), 0u);
}

TEST(RuleCodecTest, NonArrayFails) {
    EXPECT_TRUE(RuleCodec::parse_alerts(R"({"rules": []})").is_err());
}

// ============================================================================
// Replay feed
// ============================================================================

TEST(RuleCodecTest, ParsesFeed) {
    auto result = RuleCodec::parse_feed(R"({
        "ticks": [
            {
                "at": "2024-01-17T12:00:00Z",
                "market": {
                    "SBER": {"price": 280.5, "previousClose": 275.0, "volume": 1200000,
                             "averageVolume": 900000, "rsi": 62.1}
                },
                "news": {
                    "SBER": {
                        "articles": [
                            {"title": "Dividend record", "summary": "profit growth",
                             "publishedAt": "2024-01-17T09:00:00Z"},
                            {"title": "Plain update"}
                        ],
                        "averageSentiment": 0.4
                    }
                },
                "history": {
                    "SBER": [
                        {"timestamp": "2024-01-16T12:00:00Z", "price": 276.0, "volume": 100},
                        {"timestamp": "2024-01-17T11:00:00Z", "price": 279.0}
                    ]
                }
            },
            {}
        ]
    })");
    ASSERT_TRUE(result.is_ok()) << result.error();
    ASSERT_EQ(result.value().size(), 2u);

    const auto& tick = result.value()[0];
    const auto at = parse_iso8601("2024-01-17T12:00:00Z");
    EXPECT_EQ(tick.at, at);

    const auto& market = tick.market.at("SBER");
    EXPECT_EQ(market.ticker, "SBER");
    EXPECT_DOUBLE_EQ(market.price, 280.5);
    EXPECT_DOUBLE_EQ(market.previous_close, 275.0);
    EXPECT_EQ(market.average_volume, std::optional<double>(900000.0));
    EXPECT_EQ(market.rsi, std::optional<double>(62.1));
    EXPECT_FALSE(market.pe_ratio.has_value());
    EXPECT_EQ(market.observed_at, *at);

    const auto& news = tick.news.at("SBER");
    ASSERT_EQ(news.articles.size(), 2u);
    EXPECT_EQ(news.article_count, 2u);
    EXPECT_EQ(news.average_sentiment, std::optional<double>(0.4));
    EXPECT_TRUE(news.articles[0].published_at.has_value());
    EXPECT_FALSE(news.articles[1].published_at.has_value());

    const auto& history = tick.history.at("SBER");
    ASSERT_EQ(history.size(), 2u);
    EXPECT_DOUBLE_EQ(history[1].price, 279.0);
    EXPECT_DOUBLE_EQ(history[1].volume, 0.0);

    const auto& empty = result.value()[1];
    EXPECT_FALSE(empty.at.has_value());
    EXPECT_TRUE(empty.market.empty());
}

TEST(RuleCodecTest, NewsCountOverridesArticles) {
    auto result = RuleCodec::parse_feed(R"({"ticks": [{"news": {"SBER": {"newsCount": 7}}}]})");
    ASSERT_TRUE(result.is_ok()) << result.error();

    const auto& news = result.value()[0].news.at("SBER");
    EXPECT_TRUE(news.articles.empty());
    EXPECT_EQ(news.article_count, 7u);
    EXPECT_FALSE(news.average_sentiment.has_value());
}

TEST(RuleCodecTest, FeedMissingPriceFails) {
    auto result = RuleCodec::parse_feed(R"({"ticks": [{"market": {"SBER": {"volume": 10}}}]})");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("market.SBER"), std::string::npos);
}

TEST(RuleCodecTest, FeedWithoutTicksFails) {
    auto result = RuleCodec::parse_feed(R"({"market": {}})");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), "Missing ticks array in feed");
}

// ============================================================================
// Files
// ============================================================================

TEST(RuleCodecTest, LoadMissingFileFails) {
    auto result = RuleCodec::load_alerts("/nonexistent/rules.json");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().rfind("Failed to open file:", 0), 0u);
}

TEST(RuleCodecTest, LoadsRuleFile) {
    const std::string path = "/tmp/vigil_test_rules.json";
    {
        std::ofstream file(path);
        file << R"({"alerts": [{"id": "a1", "ticker": "SBER", "type": "NEWS_TRIGGERED"}]})";
    }

    auto result = RuleCodec::load_alerts(path);
    std::remove(path.c_str());

    ASSERT_TRUE(result.is_ok()) << result.error();
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].type, AlertType::NewsTriggered);
}
