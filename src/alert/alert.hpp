#pragma once

#include "alert/enums.hpp"
#include "core/time_utils.hpp"
#include "core/time_zone.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace vigil {

/// Atomic comparison: field OP threshold
struct Condition {
    std::string id;
    ConditionField field{ConditionField::Price};
    Operator op{Operator::GreaterThan};
    double threshold{0.0};
};

/// Conditions combined with AND/OR
struct ConditionGroup {
    std::string id;
    Logic logic{Logic::And};
    std::vector<Condition> conditions;
};

/// Parameters for ANOMALY alerts
struct AnomalyConfig {
    Percent price_change_threshold{15.0};
    double volume_spike_multiplier{5.0};
    double statistical_sigma{2.0};
    bool requires_no_news{true};
    std::chrono::hours news_lookback{24};
};

/// Rate limiting and batching policy
struct Frequency {
    int max_per_day{3};
    std::chrono::minutes cooldown{60};
    bool batching_enabled{true};
    std::chrono::minutes batching_window{15};
};

/// Do-not-disturb window; start > end means the window runs through midnight.
/// The window is read on the alert's wall clock: `zone` when resolved, else `utc_offset`.
/// The same clock decides where the alert's day starts for the daily cap.
struct QuietHours {
    bool enabled{false};
    TimeOfDay start{22, 0};
    TimeOfDay end{8, 0};
    std::set<int> days{0, 1, 2, 3, 4, 5, 6};  // 0 = Sunday
    std::chrono::minutes utc_offset{0};
    std::string time_zone;                    // IANA name as configured, may be empty
    TimeZone::Ptr zone;
};

/// A watch rule. Status and trigger bookkeeping change only through alert_mutations.
struct Alert {
    AlertId id;
    Ticker ticker;
    std::string name;
    AlertType type{AlertType::Threshold};
    AlertPriority priority{AlertPriority::Medium};
    AlertStatus status{AlertStatus::Active};

    // Only read for THRESHOLD / MULTI_CONDITION
    std::vector<ConditionGroup> condition_groups;

    // Only read for ANOMALY; the configured default applies when absent
    std::optional<AnomalyConfig> anomaly_config;

    Frequency frequency;
    QuietHours quiet_hours;

    std::optional<Timestamp> expires_at;
    std::optional<Timestamp> snoozed_until;
    std::optional<Timestamp> last_triggered_at;
    std::uint32_t triggered_count{0};
};

/// Created once per positive evaluation, never mutated by the engine afterwards
struct TriggerEvent {
    EventId id;
    AlertId alert_id;
    Ticker ticker;
    Timestamp triggered_at;
    std::string reason;
    std::vector<std::string> conditions_met;

    Price price_at_trigger{0.0};
    std::optional<Volume> volume_at_trigger;
    std::optional<std::size_t> news_count;
    std::optional<double> sentiment;

    UserAction user_action{UserAction::Pending};
};

}  // namespace vigil
