#include "engine/trigger_history.hpp"
#include <algorithm>

namespace vigil {

std::size_t InMemoryTriggerHistory::triggers_today(const AlertId& alert_id, const DayWindow& today) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = triggers_.find(alert_id);
    if (it == triggers_.end()) {
        return 0;
    }
    return static_cast<std::size_t>(std::count_if(
        it->second.begin(), it->second.end(),
        [&today](Timestamp t) { return today.contains(t); }));
}

void InMemoryTriggerHistory::record(const TriggerEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    triggers_[event.alert_id].push_back(event.triggered_at);
}

void InMemoryTriggerHistory::prune_before(Timestamp cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = triggers_.begin(); it != triggers_.end();) {
        auto& times = it->second;
        times.erase(std::remove_if(times.begin(), times.end(),
                                   [cutoff](Timestamp t) { return t < cutoff; }),
                    times.end());
        if (times.empty()) {
            it = triggers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t InMemoryTriggerHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& [id, times] : triggers_) {
        total += times.size();
    }
    return total;
}

}  // namespace vigil
