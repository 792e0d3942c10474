#pragma once

#include "alert/alert.hpp"
#include "core/types.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vigil {

/// Trailing-edge debounce of trigger events per key (ticker)
///
/// Every add re-arms the key's single timer, so a key only flushes once it
/// has been quiet for a full window. All batch state is owned by one
/// io_context thread: adds are posted to it, timer expiry runs on it, and
/// flush/queries hop onto it and wait. Add and expiry for a key therefore
/// never interleave. Delivery callbacks run on that thread.
class DebounceBatcher {
public:
    using BatchCallback =
        std::function<void(const Ticker& key, const std::vector<TriggerEvent>& events)>;

    /// Create a batcher and start its timer thread
    DebounceBatcher();

    /// Stops the timer thread; batches still pending are dropped (use flush_all first)
    ~DebounceBatcher();

    // Non-copyable, non-movable
    DebounceBatcher(const DebounceBatcher&) = delete;
    DebounceBatcher& operator=(const DebounceBatcher&) = delete;

    /// Queue an event and (re)arm the key's timer. Never blocks on delivery.
    /// @param key Batch key (the event's ticker)
    /// @param event Event to queue
    /// @param window Quiet period after the latest event before delivery
    /// @param on_ready Invoked once with the whole queue when the timer fires
    void add_to_batch(
        Ticker key,
        TriggerEvent event,
        std::chrono::milliseconds window,
        BatchCallback on_ready
    );

    /// Cancel all timers and deliver every non-empty batch now, then clear all state.
    /// Blocks until every callback has returned, or until a concurrent stop() wins.
    void flush_all(const BatchCallback& on_ready);

    /// Stop the timer thread (idempotent)
    void stop();

    /// Number of keys with a pending batch
    [[nodiscard]] std::size_t pending_keys() const;

    /// Number of events queued for a key
    [[nodiscard]] std::size_t pending_events(const Ticker& key) const;

    [[nodiscard]] bool is_running() const noexcept;

private:
    struct Batch {
        std::vector<TriggerEvent> events;
        std::unique_ptr<boost::asio::steady_timer> timer;
        std::uint64_t generation{0};
        BatchCallback on_ready;
    };

    void arm(Ticker key, TriggerEvent event, std::chrono::milliseconds window, BatchCallback on_ready);
    void on_timer(const Ticker& key, std::uint64_t generation, const boost::system::error_code& ec);
    void flush_now(const BatchCallback& on_ready);

    /// Run `fn` on the io thread and wait for it (inline when already there).
    /// Returns without running it if stop() ends the io thread first.
    void run_sync(const std::function<void()>& fn) const;

    static void deliver(const Ticker& key, const std::vector<TriggerEvent>& events,
                        const BatchCallback& on_ready);

    mutable boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> io_stopped_{false};  // Set once io_thread_ has been joined

    // Touched only from io_thread_ (or after it has been joined)
    std::unordered_map<Ticker, Batch> batches_;
    std::uint64_t next_generation_{0};
};

}  // namespace vigil
