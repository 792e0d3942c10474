#pragma once

#include "alert/alert.hpp"
#include "engine/tick_runner.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace vigil::output {

/// Formats engine output as JSON for the notification layer
class JsonFormatter {
public:
    /// Format a trigger event (wire names of the alert store)
    [[nodiscard]] static nlohmann::json format_event(const TriggerEvent& event);

    /// Format a delivered batch: one notification for a ticker
    [[nodiscard]] static nlohmann::json format_batch(
        const Ticker& ticker,
        const std::vector<TriggerEvent>& events
    );

    /// Format a tick summary
    [[nodiscard]] static nlohmann::json format_tick_report(const TickReport& report);
};

}  // namespace vigil::output
