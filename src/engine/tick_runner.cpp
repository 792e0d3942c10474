#include "engine/tick_runner.hpp"
#include "engine/alert_mutations.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <optional>
#include <spdlog/spdlog.h>

namespace vigil {

namespace {

template <typename Map>
const typename Map::mapped_type* find_ptr(const Map& map, const Ticker& ticker) {
    auto it = map.find(ticker);
    return it != map.end() ? &it->second : nullptr;
}

/// Per-alert result slot written by exactly one worker
struct Slot {
    std::optional<AlertEvaluation> evaluation;
    bool missing_market{false};
    bool failed{false};
};

}  // namespace

TickRunner::TickRunner(
    const AlertEngine& engine,
    TriggerHistory& history,
    DebounceBatcher& batcher,
    DeliveryCallback deliver,
    std::size_t worker_threads,
    std::chrono::minutes default_window
)
    : engine_(engine)
    , history_(history)
    , batcher_(batcher)
    , deliver_(std::move(deliver))
    , worker_threads_(std::max<std::size_t>(1, worker_threads))
    , default_window_(default_window)
{}

TickReport TickRunner::run(std::vector<Alert>& alerts, const TickSnapshot& snapshot, Timestamp now) {
    TickReport report;
    report.at = now;
    report.lifecycle_changes = refresh_lifecycle(alerts, now);

    std::vector<Slot> slots(alerts.size());

    // Fan out: workers only read alerts/snapshot/history and write their own slot
    {
        boost::asio::thread_pool pool(worker_threads_);
        for (std::size_t i = 0; i < alerts.size(); ++i) {
            boost::asio::post(pool, [this, &alerts, &snapshot, &slots, now, i]() {
                const Alert& alert = alerts[i];
                Slot& slot = slots[i];

                const MarketObservation* market = find_ptr(snapshot.market, alert.ticker);
                if (market == nullptr) {
                    slot.missing_market = true;
                    return;
                }

                try {
                    slot.evaluation = engine_.evaluate(
                        alert,
                        *market,
                        find_ptr(snapshot.news, alert.ticker),
                        find_ptr(snapshot.history, alert.ticker),
                        now,
                        history_);
                } catch (const std::exception& e) {
                    spdlog::error("Alert {} ({}) evaluation failed: {}",
                                  alert.id, alert.ticker, e.what());
                    slot.failed = true;
                } catch (...) {
                    spdlog::error("Alert {} ({}) evaluation failed: unknown exception",
                                  alert.id, alert.ticker);
                    slot.failed = true;
                }
            });
        }
        pool.join();
    }

    // Join: apply bookkeeping and hand off in rule order
    for (std::size_t i = 0; i < alerts.size(); ++i) {
        Alert& alert = alerts[i];
        Slot& slot = slots[i];

        if (slot.missing_market) {
            ++report.missing_market;
            if (alert.status == AlertStatus::Active) {
                spdlog::warn("No market data for {} (alert {})", alert.ticker, alert.id);
            }
            continue;
        }
        if (slot.failed || !slot.evaluation) {
            ++report.failures;
            continue;
        }

        auto& evaluation = *slot.evaluation;
        if (evaluation.gate != GateDecision::Proceed) {
            ++report.skipped[evaluation.gate];
            continue;
        }

        ++report.evaluated;
        if (!evaluation.event) {
            continue;
        }

        ++report.triggered;
        record_trigger(alert, *evaluation.event);
        history_.record(*evaluation.event);
        hand_off(alert, *evaluation.event);
        report.events.push_back(std::move(*evaluation.event));
    }

    return report;
}

void TickRunner::hand_off(const Alert& alert, const TriggerEvent& event) {
    if (alert.frequency.batching_enabled) {
        const auto window = alert.frequency.batching_window.count() > 0
            ? alert.frequency.batching_window
            : default_window_;
        batcher_.add_to_batch(event.ticker, event, window, deliver_);
        return;
    }

    try {
        deliver_(event.ticker, std::vector<TriggerEvent>{event});
    } catch (const std::exception& e) {
        spdlog::error("Delivery of event {} for {} failed: {}", event.id, event.ticker, e.what());
    } catch (...) {
        spdlog::error("Delivery of event {} for {} failed: unknown exception", event.id, event.ticker);
    }
}

}  // namespace vigil
