#include "output/console_logger.hpp"
#include "core/time_utils.hpp"
#include "eval/gating.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace vigil::output {

namespace {

std::string format_skipped(const TickReport& report) {
    if (report.skipped.empty()) {
        return "none";
    }
    std::ostringstream out;
    bool first = true;
    for (const auto& [gate, count] : report.skipped) {
        if (!first) {
            out << ", ";
        }
        out << to_string(gate) << "=" << count;
        first = false;
    }
    return out.str();
}

}  // namespace

ConsoleLogger::ConsoleLogger(std::chrono::milliseconds interval)
    : interval_(interval)
    , last_output_(std::chrono::steady_clock::now() - interval)
{}

bool ConsoleLogger::log_tick_report(const TickReport& report) {
    auto now = std::chrono::steady_clock::now();

    if (!force_next_ && report.triggered == 0 && (now - last_output_) < interval_) {
        return false;
    }

    force_next_ = false;
    last_output_ = now;

    // Format: TICK: time | EVAL: n | FIRED: n | SKIP: gate=n, ... | NO DATA: n | FAIL: n
    spdlog::info(
        "TICK: {} | EVAL: {} | FIRED: {} | SKIP: {} | NO DATA: {} | FAIL: {} | LIFECYCLE: {}",
        format_iso8601(report.at),
        report.evaluated,
        report.triggered,
        format_skipped(report),
        report.missing_market,
        report.failures,
        report.lifecycle_changes
    );

    return true;
}

void ConsoleLogger::log_trigger(const TriggerEvent& event) {
    spdlog::warn(
        "ALERT: {} {} @ {:.2f} | {}",
        event.ticker,
        event.alert_id,
        event.price_at_trigger,
        event.reason
    );
}

void ConsoleLogger::log_batch(const Ticker& ticker, const std::vector<TriggerEvent>& events) {
    if (events.size() == 1) {
        log_trigger(events.front());
        return;
    }

    spdlog::warn("ALERT BATCH: {} ({} events)", ticker, events.size());
    for (const auto& event : events) {
        spdlog::warn("  - {} @ {:.2f} | {}", event.alert_id, event.price_at_trigger, event.reason);
    }
}

}  // namespace vigil::output
