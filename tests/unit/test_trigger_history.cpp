#include <gtest/gtest.h>
#include "engine/trigger_history.hpp"
#include <thread>

using namespace vigil;
using namespace std::chrono;

namespace {

Timestamp at(std::string_view iso) {
    return parse_iso8601(iso).value();
}

DayWindow utc_day(std::string_view iso) {
    return day_window(at(iso), minutes(0));
}

TriggerEvent fired(const AlertId& alert_id, Timestamp when) {
    TriggerEvent event;
    event.alert_id = alert_id;
    event.triggered_at = when;
    return event;
}

}  // namespace

TEST(TriggerHistoryTest, CountsOnlyTheCurrentDay) {
    InMemoryTriggerHistory history;
    history.record(fired("a1", at("2024-01-16T23:59:00Z")));
    history.record(fired("a1", at("2024-01-17T00:00:00Z")));
    history.record(fired("a1", at("2024-01-17T09:30:00Z")));

    EXPECT_EQ(history.triggers_today("a1", utc_day("2024-01-17T12:00:00Z")), 2u);
    EXPECT_EQ(history.triggers_today("a1", utc_day("2024-01-16T12:00:00Z")), 1u);
    EXPECT_EQ(history.triggers_today("a1", utc_day("2024-01-18T00:00:00Z")), 0u);
}

TEST(TriggerHistoryTest, AlertsAreCountedSeparately) {
    InMemoryTriggerHistory history;
    auto now = at("2024-01-17T12:00:00Z");
    auto today = day_window(now, minutes(0));
    history.record(fired("a1", now));
    history.record(fired("a2", now));
    history.record(fired("a2", now));

    EXPECT_EQ(history.triggers_today("a1", today), 1u);
    EXPECT_EQ(history.triggers_today("a2", today), 2u);
    EXPECT_EQ(history.triggers_today("unknown", today), 0u);
    EXPECT_EQ(history.size(), 3u);
}

TEST(TriggerHistoryTest, CountsInsideTheGivenWindow) {
    InMemoryTriggerHistory history;
    // 22:00 UTC on the 16th is already the 17th in UTC+3
    history.record(fired("a1", at("2024-01-16T22:00:00Z")));

    EXPECT_EQ(history.triggers_today("a1", day_window(at("2024-01-17T12:00:00Z"), hours(3))), 1u);
    EXPECT_EQ(history.triggers_today("a1", utc_day("2024-01-17T12:00:00Z")), 0u);
}

TEST(TriggerHistoryTest, PruneDropsOldEntries) {
    InMemoryTriggerHistory history;
    history.record(fired("a1", at("2024-01-15T10:00:00Z")));
    history.record(fired("a1", at("2024-01-17T10:00:00Z")));
    history.record(fired("a2", at("2024-01-15T11:00:00Z")));

    history.prune_before(at("2024-01-16T00:00:00Z"));

    EXPECT_EQ(history.size(), 1u);
    EXPECT_EQ(history.triggers_today("a1", utc_day("2024-01-17T12:00:00Z")), 1u);
}

TEST(TriggerHistoryTest, ConcurrentReadersAndWriter) {
    InMemoryTriggerHistory history;
    auto now = at("2024-01-17T12:00:00Z");
    auto today = day_window(now, minutes(0));

    std::thread writer([&]() {
        for (int i = 0; i < 500; ++i) {
            history.record(fired("a1", now));
        }
    });
    std::thread reader([&]() {
        for (int i = 0; i < 500; ++i) {
            (void)history.triggers_today("a1", today);
        }
    });
    writer.join();
    reader.join();

    EXPECT_EQ(history.triggers_today("a1", today), 500u);
}
