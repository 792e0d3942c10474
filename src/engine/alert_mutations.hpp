#pragma once

#include "alert/alert.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <vector>

namespace vigil {

// The one mutation path for alert status and trigger bookkeeping, shared by
// the engine and user actions. Each returns whether anything changed.

/// Apply a fired event: last_triggered_at and triggered_count
void record_trigger(Alert& alert, const TriggerEvent& event);

/// Pause evaluation until `until`
bool snooze(Alert& alert, Timestamp until);

bool dismiss(Alert& alert);

/// ACTIVE -> DISABLED, anything else -> ACTIVE
bool toggle(Alert& alert);

std::size_t enable_all(std::vector<Alert>& alerts);
std::size_t disable_all(std::vector<Alert>& alerts);

/// Wake snoozed alerts whose snooze has elapsed and expire alerts past expires_at
/// @return Number of alerts whose status changed
std::size_t refresh_lifecycle(std::vector<Alert>& alerts, Timestamp now);

}  // namespace vigil
