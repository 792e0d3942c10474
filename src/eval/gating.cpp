#include "eval/gating.hpp"

namespace vigil {

std::chrono::minutes utc_offset_at(const QuietHours& quiet_hours, Timestamp at) {
    return quiet_hours.zone ? quiet_hours.zone->offset_at(at) : quiet_hours.utc_offset;
}

DayWindow local_day(const QuietHours& quiet_hours, Timestamp now) {
    const auto offset_now = utc_offset_at(quiet_hours, now);
    const DayWindow guess = day_window(now, offset_now);
    if (!quiet_hours.zone) {
        return guess;
    }
    // Re-anchor each midnight to the offset actually in force there
    return DayWindow{
        guess.begin + offset_now - utc_offset_at(quiet_hours, guess.begin),
        guess.end + offset_now - utc_offset_at(quiet_hours, guess.end)
    };
}

bool in_quiet_hours(const QuietHours& quiet_hours, Timestamp now) {
    if (!quiet_hours.enabled) {
        return false;
    }

    const LocalTime local = to_local_time(now, utc_offset_at(quiet_hours, now));
    if (quiet_hours.days.count(local.weekday) == 0) {
        return false;
    }

    const TimeOfDay current = local.time;
    if (quiet_hours.start > quiet_hours.end) {
        // Overnight window, e.g. 22:00 - 08:00
        return current >= quiet_hours.start || current <= quiet_hours.end;
    }
    return current >= quiet_hours.start && current <= quiet_hours.end;
}

bool in_cooldown(const Alert& alert, Timestamp now) {
    if (!alert.last_triggered_at) {
        return false;
    }
    return (now - *alert.last_triggered_at) < alert.frequency.cooldown;
}

GateDecision check_gates(
    const Alert& alert,
    Timestamp now,
    const TriggerHistory& history
) {
    if (alert.status != AlertStatus::Active) {
        return GateDecision::Inactive;
    }

    if (alert.expires_at && now > *alert.expires_at) {
        return GateDecision::Expired;
    }

    if (in_quiet_hours(alert.quiet_hours, now)) {
        return GateDecision::QuietHours;
    }

    if (in_cooldown(alert, now)) {
        return GateDecision::Cooldown;
    }

    const auto max_per_day = alert.frequency.max_per_day < 0
        ? std::size_t{0}
        : static_cast<std::size_t>(alert.frequency.max_per_day);
    if (history.triggers_today(alert.id, local_day(alert.quiet_hours, now)) >= max_per_day) {
        return GateDecision::DailyCap;
    }

    return GateDecision::Proceed;
}

}  // namespace vigil
