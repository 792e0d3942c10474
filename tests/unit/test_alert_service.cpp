#include <gtest/gtest.h>
#include "engine/alert_service.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <thread>

using namespace vigil;
using namespace std::chrono;

class AlertServiceTest : public ::testing::Test {
protected:
    std::string rules_path = "test_service_rules.json";
    std::string feed_path = "test_service_feed.json";
    Config config = Config::defaults();

    void SetUp() override {
        config.engine.tick_interval = milliseconds(0);
        config.engine.worker_threads = 2;
        config.input.rules_path = rules_path;
        config.input.feed_path = feed_path;
        config.logging.level = "warn";
    }

    void TearDown() override {
        std::remove(rules_path.c_str());
        std::remove(feed_path.c_str());
    }

    static void write_file(const std::string& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }
};

TEST_F(AlertServiceTest, MissingRulesFileFails) {
    write_file(feed_path, R"({"ticks": []})");

    AlertService service(config);
    EXPECT_FALSE(service.run());
    EXPECT_EQ(service.ticks_run(), 0u);
}

TEST_F(AlertServiceTest, MalformedFeedFails) {
    write_file(rules_path, R"({"alerts": []})");
    write_file(feed_path, R"({"ticks": [)");

    AlertService service(config);
    EXPECT_FALSE(service.run());
}

TEST_F(AlertServiceTest, RunsEveryTickAndFlushesBatchesAtFeedEnd) {
    write_file(rules_path, R"({"alerts": [
        {"id": "batched", "ticker": "SBER", "type": "THRESHOLD",
         "frequency": {"cooldownMinutes": 0, "maxPerDay": 10,
                       "batchingEnabled": true, "batchingWindowMinutes": 15},
         "conditionGroups": [{"id": "g1", "conditions": [
            {"id": "c1", "field": "PRICE", "operator": "GREATER_THAN", "value": 100}]}]},
        {"id": "direct", "ticker": "GAZP", "type": "THRESHOLD",
         "frequency": {"cooldownMinutes": 0, "maxPerDay": 10, "batchingEnabled": false},
         "conditionGroups": [{"id": "g1", "conditions": [
            {"id": "c1", "field": "PRICE", "operator": "GREATER_THAN", "value": 100}]}]}
    ]})");
    write_file(feed_path, R"({"ticks": [
        {"at": "2024-01-17T12:00:00Z",
         "market": {"SBER": {"price": 150}, "GAZP": {"price": 150}}},
        {"at": "2024-01-17T12:05:00Z",
         "market": {"SBER": {"price": 155}, "GAZP": {"price": 155}}}
    ]})");

    AlertService service(config);
    ASSERT_TRUE(service.run());

    EXPECT_EQ(service.ticks_run(), 2u);
    // GAZP: one batch per firing; SBER: both firings held in one window until shutdown
    EXPECT_EQ(service.batches_delivered(), 3u);
    EXPECT_EQ(service.events_delivered(), 4u);
    EXPECT_EQ(service.trigger_history().size(), 4u);
}

TEST_F(AlertServiceTest, RawArticlesAreScored) {
    write_file(rules_path, R"({"alerts": [
        {"id": "gloom", "ticker": "SBER", "type": "THRESHOLD",
         "frequency": {"batchingEnabled": false},
         "conditionGroups": [{"id": "g1", "conditions": [
            {"id": "c1", "field": "NEWS_SENTIMENT", "operator": "LESS_THAN", "value": 0}]}]}
    ]})");
    write_file(feed_path, R"({"ticks": [
        {"at": "2024-01-17T12:00:00Z",
         "market": {"SBER": {"price": 250}},
         "news": {"SBER": {"articles": [{"title": "Losses mount"}]}}}
    ]})");

    AlertService service(config);
    ASSERT_TRUE(service.run());

    EXPECT_EQ(service.events_delivered(), 1u);
}

TEST_F(AlertServiceTest, HistoryKeepsOneDay) {
    write_file(rules_path, R"({"alerts": [
        {"id": "a1", "ticker": "SBER", "type": "THRESHOLD",
         "frequency": {"batchingEnabled": false},
         "conditionGroups": [{"id": "g1", "conditions": [
            {"id": "c1", "field": "PRICE", "operator": "GREATER_THAN", "value": 100}]}]}
    ]})");
    write_file(feed_path, R"({"ticks": [
        {"at": "2024-01-17T12:00:00Z", "market": {"SBER": {"price": 150}}},
        {"at": "2024-01-18T13:00:00Z", "market": {"SBER": {"price": 150}}}
    ]})");

    AlertService service(config);
    ASSERT_TRUE(service.run());

    EXPECT_EQ(service.events_delivered(), 2u);
    // The first trigger is more than 24h older than the second tick
    EXPECT_EQ(service.trigger_history().size(), 1u);
}

TEST_F(AlertServiceTest, ShutdownStopsALongFeed) {
    config.engine.tick_interval = milliseconds(20);
    write_file(rules_path, R"({"alerts": []})");

    std::string ticks;
    for (int i = 0; i < 500; ++i) {
        ticks += (i == 0 ? "" : ",");
        ticks += R"({"market": {"SBER": {"price": 100}}})";
    }
    write_file(feed_path, R"({"ticks": [)" + ticks + "]}");

    AlertService service(config);
    std::thread stopper([&service]() {
        std::this_thread::sleep_for(milliseconds(200));
        service.request_shutdown();
    });

    EXPECT_TRUE(service.run());
    stopper.join();

    EXPECT_LT(service.ticks_run(), 500u);
}
