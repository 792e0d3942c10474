#include "engine/alert_mutations.hpp"
#include "core/time_utils.hpp"
#include <spdlog/spdlog.h>

namespace vigil {

namespace {

bool set_status(Alert& alert, AlertStatus status) {
    if (alert.status == status) {
        return false;
    }
    spdlog::debug("Alert {}: {} -> {}", alert.id, to_string(alert.status), to_string(status));
    alert.status = status;
    return true;
}

}  // namespace

void record_trigger(Alert& alert, const TriggerEvent& event) {
    alert.last_triggered_at = event.triggered_at;
    ++alert.triggered_count;
}

bool snooze(Alert& alert, Timestamp until) {
    alert.snoozed_until = until;
    spdlog::info("Alert {} snoozed until {}", alert.id, format_iso8601(until));
    set_status(alert, AlertStatus::Snoozed);
    return true;
}

bool dismiss(Alert& alert) {
    alert.snoozed_until.reset();
    return set_status(alert, AlertStatus::Dismissed);
}

bool toggle(Alert& alert) {
    if (alert.status == AlertStatus::Active) {
        return set_status(alert, AlertStatus::Disabled);
    }
    alert.snoozed_until.reset();
    return set_status(alert, AlertStatus::Active);
}

std::size_t enable_all(std::vector<Alert>& alerts) {
    std::size_t changed = 0;
    for (auto& alert : alerts) {
        alert.snoozed_until.reset();
        if (set_status(alert, AlertStatus::Active)) {
            ++changed;
        }
    }
    return changed;
}

std::size_t disable_all(std::vector<Alert>& alerts) {
    std::size_t changed = 0;
    for (auto& alert : alerts) {
        if (set_status(alert, AlertStatus::Disabled)) {
            ++changed;
        }
    }
    return changed;
}

std::size_t refresh_lifecycle(std::vector<Alert>& alerts, Timestamp now) {
    std::size_t changed = 0;
    for (auto& alert : alerts) {
        if (alert.status == AlertStatus::Snoozed && alert.snoozed_until &&
            now >= *alert.snoozed_until) {
            alert.snoozed_until.reset();
            if (set_status(alert, AlertStatus::Active)) {
                ++changed;
            }
        }

        // Dismissed and disabled alerts keep their status past expiry
        const bool live = alert.status == AlertStatus::Active ||
                          alert.status == AlertStatus::Triggered ||
                          alert.status == AlertStatus::Snoozed;
        if (live && alert.expires_at && now > *alert.expires_at) {
            if (set_status(alert, AlertStatus::Expired)) {
                ++changed;
            }
        }
    }
    return changed;
}

}  // namespace vigil
