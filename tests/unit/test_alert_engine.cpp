#include <gtest/gtest.h>
#include "engine/alert_engine.hpp"
#include "engine/trigger_history.hpp"

using namespace vigil;
using namespace std::chrono;

class AlertEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        alert.id = "a1";
        alert.ticker = "SBER";
        alert.name = "SBER above 100";
        alert.type = AlertType::Threshold;
        alert.condition_groups = {ConditionGroup{.id = "g1", .logic = Logic::And, .conditions = {
            Condition{.id = "c1", .field = ConditionField::Price, .op = Operator::GreaterThan, .threshold = 100.0},
        }}};
    }

    AlertEvaluation run(const NewsContext* news = nullptr, const PriceHistory* history = nullptr) {
        return engine.evaluate(alert, market, news, history, now, triggers);
    }

    Config config = Config::defaults();
    AlertEngine engine{config};
    InMemoryTriggerHistory triggers;
    Timestamp now = parse_iso8601("2024-01-17T12:00:00Z").value();
    Alert alert;

    MarketObservation market{
        .ticker = "SBER",
        .price = 105.0,
        .previous_close = 104.0,
        .volume = 1500.0,
        .average_volume = 1000.0,
    };
};

// ============================================================================
// Threshold / multi-condition
// ============================================================================

TEST_F(AlertEngineTest, ThresholdAlertFires) {
    auto evaluation = run();

    EXPECT_EQ(evaluation.gate, GateDecision::Proceed);
    ASSERT_TRUE(evaluation.triggered());

    const auto& event = *evaluation.event;
    EXPECT_FALSE(event.id.empty());
    EXPECT_EQ(event.alert_id, "a1");
    EXPECT_EQ(event.ticker, "SBER");
    EXPECT_EQ(event.triggered_at, now);
    EXPECT_DOUBLE_EQ(event.price_at_trigger, 105.0);
    ASSERT_TRUE(event.volume_at_trigger.has_value());
    EXPECT_DOUBLE_EQ(*event.volume_at_trigger, 1500.0);
    EXPECT_FALSE(event.news_count.has_value());
    EXPECT_FALSE(event.sentiment.has_value());
    EXPECT_EQ(event.user_action, UserAction::Pending);
    EXPECT_EQ(event.conditions_met.size(), 1u);
    EXPECT_EQ(event.reason.rfind("Conditions met: PRICE", 0), 0u);
}

TEST_F(AlertEngineTest, EventIdsAreUnique) {
    auto first = run();
    auto second = run();
    ASSERT_TRUE(first.triggered() && second.triggered());
    EXPECT_NE(first.event->id, second.event->id);
}

TEST_F(AlertEngineTest, ThresholdAlertQuietWhenUnmet) {
    market.price = 99.0;
    auto evaluation = run();

    EXPECT_EQ(evaluation.gate, GateDecision::Proceed);
    EXPECT_FALSE(evaluation.triggered());
    EXPECT_EQ(evaluation.result.reason, "No conditions met");
}

TEST_F(AlertEngineTest, EvaluateDoesNotMutateAlert) {
    auto evaluation = run();
    ASSERT_TRUE(evaluation.triggered());

    EXPECT_EQ(alert.status, AlertStatus::Active);
    EXPECT_FALSE(alert.last_triggered_at.has_value());
    EXPECT_EQ(alert.triggered_count, 0u);
}

TEST_F(AlertEngineTest, GatedAlertIsNotEvaluated) {
    alert.status = AlertStatus::Snoozed;
    auto evaluation = run();

    EXPECT_EQ(evaluation.gate, GateDecision::Inactive);
    EXPECT_FALSE(evaluation.triggered());
    EXPECT_TRUE(evaluation.result.reason.empty());
}

TEST_F(AlertEngineTest, DailyCapUsesHistory) {
    alert.frequency.max_per_day = 1;
    TriggerEvent earlier;
    earlier.alert_id = "a1";
    earlier.triggered_at = now - hours(3);
    triggers.record(earlier);

    EXPECT_EQ(run().gate, GateDecision::DailyCap);
}

TEST_F(AlertEngineTest, NewsContextIsCopiedIntoEvent) {
    NewsContext news{.ticker = "SBER", .article_count = 2, .average_sentiment = 0.1};
    auto evaluation = run(&news);

    ASSERT_TRUE(evaluation.triggered());
    EXPECT_EQ(evaluation.event->news_count, std::optional<std::size_t>(2));
    EXPECT_EQ(evaluation.event->sentiment, std::optional<double>(0.1));
}

// ============================================================================
// News-triggered
// ============================================================================

TEST_F(AlertEngineTest, NewsAlertFiresOnNegativeSentiment) {
    alert.type = AlertType::NewsTriggered;
    NewsContext news{.ticker = "SBER", .article_count = 3, .average_sentiment = -0.5};

    auto evaluation = run(&news);

    ASSERT_TRUE(evaluation.triggered());
    EXPECT_EQ(evaluation.event->reason, "Negative news sentiment detected: -0.50");
    EXPECT_EQ(evaluation.event->news_count, std::optional<std::size_t>(3));
}

TEST_F(AlertEngineTest, NewsAlertScoresRawArticles) {
    alert.type = AlertType::NewsTriggered;
    NewsContext news{.ticker = "SBER", .articles = {
        NewsItem{.title = "Bankruptcy fears", .summary = "debt crisis and default risk"},
    }, .article_count = 1};

    auto evaluation = run(&news);

    ASSERT_TRUE(evaluation.triggered());
    ASSERT_TRUE(evaluation.event->sentiment.has_value());
    EXPECT_LT(*evaluation.event->sentiment, -0.3);
}

TEST_F(AlertEngineTest, NewsAlertIgnoresConditionGroups) {
    alert.type = AlertType::NewsTriggered;
    auto evaluation = run();  // Price condition met, but no news

    EXPECT_FALSE(evaluation.triggered());
    EXPECT_EQ(evaluation.result.reason, "No news data available");
}

// ============================================================================
// Anomaly
// ============================================================================

TEST_F(AlertEngineTest, AnomalyAlertUsesDefaultConfig) {
    alert.type = AlertType::Anomaly;
    market.price = 125.0;
    market.previous_close = 100.0;

    auto evaluation = run();

    ASSERT_TRUE(evaluation.anomaly.has_value());
    EXPECT_TRUE(evaluation.anomaly->price_shock);
    EXPECT_TRUE(evaluation.triggered());
}

TEST_F(AlertEngineTest, AnomalyAlertUsesOwnConfig) {
    alert.type = AlertType::Anomaly;
    alert.anomaly_config = AnomalyConfig{.price_change_threshold = 50.0};
    market.price = 125.0;
    market.previous_close = 100.0;

    EXPECT_FALSE(run().triggered());
}

TEST_F(AlertEngineTest, AnomalyExplainedByNewsDoesNotFire) {
    alert.type = AlertType::Anomaly;
    market.price = 125.0;
    market.previous_close = 100.0;
    NewsContext news{.ticker = "SBER", .article_count = 1};

    auto evaluation = run(&news);

    ASSERT_TRUE(evaluation.anomaly.has_value());
    EXPECT_TRUE(evaluation.anomaly->explained_by_news);
    EXPECT_FALSE(evaluation.triggered());
}

TEST_F(AlertEngineTest, ConfiguredNewsThreshold) {
    config.sentiment.news_trigger_threshold = -0.6;
    AlertEngine strict(config);
    alert.type = AlertType::NewsTriggered;
    NewsContext news{.ticker = "SBER", .article_count = 3, .average_sentiment = -0.5};

    EXPECT_FALSE(strict.evaluate(alert, market, &news, nullptr, now, triggers).triggered());
}
