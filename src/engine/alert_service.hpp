#pragma once

#include "batch/debounce_batcher.hpp"
#include "core/config.hpp"
#include "engine/alert_engine.hpp"
#include "engine/tick_runner.hpp"
#include "engine/trigger_history.hpp"
#include "output/console_logger.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <memory>
#include <spdlog/logger.h>
#include <vector>

namespace vigil {

/// Evaluation service
/// Loads rules and a replay feed, runs one tick per feed entry on a timer,
/// and flushes pending batches on shutdown
class AlertService {
public:
    /// Create the service
    /// @param config Application configuration
    explicit AlertService(const Config& config);

    ~AlertService();

    // Non-copyable, non-movable
    AlertService(const AlertService&) = delete;
    AlertService& operator=(const AlertService&) = delete;

    /// Run until the feed is exhausted or shutdown is requested (blocks)
    /// @return false if rules or feed could not be loaded
    bool run();

    /// Request graceful shutdown (thread-safe)
    void request_shutdown();

    [[nodiscard]] std::size_t ticks_run() const noexcept;
    [[nodiscard]] std::size_t batches_delivered() const noexcept;
    [[nodiscard]] std::size_t events_delivered() const noexcept;

    /// Triggers still inside the one-day retention window
    [[nodiscard]] const InMemoryTriggerHistory& trigger_history() const noexcept;

private:
    void setup_logging();
    bool load_inputs();
    void score_news();
    void schedule_tick(std::chrono::milliseconds delay);
    void on_tick(const boost::system::error_code& ec);
    void deliver(const Ticker& ticker, const std::vector<TriggerEvent>& events);

    const Config& config_;

    // Output
    std::shared_ptr<spdlog::logger> delivery_log_;
    std::unique_ptr<output::ConsoleLogger> console_;

    // Evaluation components
    AlertEngine engine_;
    InMemoryTriggerHistory history_;
    DebounceBatcher batcher_;
    TickRunner runner_;

    // Inputs
    std::vector<Alert> alerts_;
    std::vector<TickSnapshot> feed_;
    std::size_t next_tick_{0};

    // Tick loop
    boost::asio::io_context ioc_;
    boost::asio::steady_timer tick_timer_;
    std::atomic<bool> shutdown_requested_{false};

    std::atomic<std::size_t> batches_delivered_{0};
    std::atomic<std::size_t> events_delivered_{0};
};

}  // namespace vigil
