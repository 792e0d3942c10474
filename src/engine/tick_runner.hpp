#pragma once

#include "alert/alert.hpp"
#include "batch/debounce_batcher.hpp"
#include "engine/alert_engine.hpp"
#include "eval/gating.hpp"
#include "market/types.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <vector>

namespace vigil {

/// Summary of one evaluation tick
struct TickReport {
    Timestamp at;
    std::size_t evaluated{0};       // Alerts that passed the gates and were evaluated
    std::size_t triggered{0};
    std::size_t failures{0};        // Alerts whose evaluation threw
    std::size_t missing_market{0};  // Alerts with no observation this tick
    std::size_t lifecycle_changes{0};
    std::map<GateDecision, std::size_t> skipped;
    std::vector<TriggerEvent> events;
};

/// Runs one evaluation tick over the whole rule set
///
/// Alerts are evaluated in parallel on a worker pool; a throwing alert is
/// logged and counted without affecting the others. Once all workers are
/// done, fired alerts are updated and their events go to the batcher (or
/// straight to delivery when the alert has batching off), on the calling
/// thread, so the alert list is never mutated concurrently.
class TickRunner {
public:
    using DeliveryCallback = DebounceBatcher::BatchCallback;

    /// @param engine Per-alert evaluator
    /// @param history Trigger history for the daily cap, updated with fired events
    /// @param batcher Debounce batcher for batched alerts
    /// @param deliver Delivery sink for batches and unbatched events
    /// @param worker_threads Evaluation parallelism
    /// @param default_window Batch window for alerts that leave theirs at zero
    TickRunner(
        const AlertEngine& engine,
        TriggerHistory& history,
        DebounceBatcher& batcher,
        DeliveryCallback deliver,
        std::size_t worker_threads = 4,
        std::chrono::minutes default_window = std::chrono::minutes{15}
    );

    /// Evaluate all alerts against a snapshot
    /// @param alerts Rule set; bookkeeping and lifecycle status are updated in place
    /// @param snapshot Market, news and history for this tick
    /// @param now Evaluation instant
    [[nodiscard]] TickReport run(std::vector<Alert>& alerts, const TickSnapshot& snapshot, Timestamp now);

private:
    void hand_off(const Alert& alert, const TriggerEvent& event);

    const AlertEngine& engine_;
    TriggerHistory& history_;
    DebounceBatcher& batcher_;
    DeliveryCallback deliver_;
    std::size_t worker_threads_;
    std::chrono::minutes default_window_;
};

}  // namespace vigil
