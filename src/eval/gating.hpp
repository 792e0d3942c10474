#pragma once

#include "alert/alert.hpp"
#include "core/time_utils.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstddef>
#include <string_view>

namespace vigil {

/// Why an alert was (or was not) allowed through to evaluation
enum class GateDecision {
    Proceed,
    Inactive,    // Status other than ACTIVE
    Expired,     // expires_at in the past
    QuietHours,  // Inside the do-not-disturb window
    Cooldown,    // Too soon after the last trigger
    DailyCap     // max_per_day reached
};

[[nodiscard]] constexpr std::string_view to_string(GateDecision decision) noexcept {
    switch (decision) {
        case GateDecision::Proceed:    return "Proceed";
        case GateDecision::Inactive:   return "Inactive";
        case GateDecision::Expired:    return "Expired";
        case GateDecision::QuietHours: return "QuietHours";
        case GateDecision::Cooldown:   return "Cooldown";
        case GateDecision::DailyCap:   return "DailyCap";
    }
    return "Unknown";
}

/// Trigger-history store (backed by external persistence)
class TriggerHistory {
public:
    virtual ~TriggerHistory() = default;

    /// Number of times the alert fired inside `today`
    [[nodiscard]] virtual std::size_t triggers_today(const AlertId& alert_id, const DayWindow& today) const = 0;

    /// Remember a trigger so later daily-cap checks count it
    virtual void record(const TriggerEvent& event) = 0;
};

/// UTC offset of the alert's wall clock at `at`: the zone's (DST included) when set,
/// else the fixed offset
[[nodiscard]] std::chrono::minutes utc_offset_at(const QuietHours& quiet_hours, Timestamp at);

/// The alert's local calendar day containing `now`. Across a DST change the
/// day is 23h or 25h long.
[[nodiscard]] DayWindow local_day(const QuietHours& quiet_hours, Timestamp now);

/// True when `now` falls in the window on one of its configured weekdays.
/// Minute resolution, both ends inclusive; start > end wraps through midnight.
[[nodiscard]] bool in_quiet_hours(const QuietHours& quiet_hours, Timestamp now);

/// True when less than the cooldown has elapsed since the last trigger
[[nodiscard]] bool in_cooldown(const Alert& alert, Timestamp now);

/// Run the gates in order, stopping at the first that blocks:
/// status, expiry, quiet hours, cooldown, daily cap.
/// The history is only consulted once every earlier gate has passed.
[[nodiscard]] GateDecision check_gates(
    const Alert& alert,
    Timestamp now,
    const TriggerHistory& history
);

}  // namespace vigil
