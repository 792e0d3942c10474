#pragma once

#include "eval/gating.hpp"
#include <cstddef>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace vigil {

/// Process-local trigger history, standing in for the persistent store.
/// Thread-safe: evaluation workers read it concurrently.
class InMemoryTriggerHistory : public TriggerHistory {
public:
    [[nodiscard]] std::size_t triggers_today(const AlertId& alert_id, const DayWindow& today) const override;

    void record(const TriggerEvent& event) override;

    /// Drop entries older than `cutoff`
    void prune_before(Timestamp cutoff);

    /// Total recorded triggers across all alerts
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<AlertId, std::vector<Timestamp>> triggers_;
};

}  // namespace vigil
