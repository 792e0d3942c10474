#pragma once

#include "alert/alert.hpp"
#include "engine/tick_runner.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace vigil::output {

/// Console output for trigger events and tick summaries
class ConsoleLogger {
public:
    /// Create a console logger
    /// @param interval Minimum time between tick summaries
    explicit ConsoleLogger(std::chrono::milliseconds interval);

    /// Log a tick summary (respects rate limiting, always logs ticks that fired)
    /// @return true if logged, false if rate limited
    bool log_tick_report(const TickReport& report);

    /// Log a single trigger event (always logs)
    void log_trigger(const TriggerEvent& event);

    /// Log a delivered batch (always logs)
    void log_batch(const Ticker& ticker, const std::vector<TriggerEvent>& events);

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_output_;
    bool force_next_{true};  // Always log first one
};

}  // namespace vigil::output
