#include "batch/debounce_batcher.hpp"
#include <boost/asio/post.hpp>
#include <exception>
#include <future>
#include <spdlog/spdlog.h>

namespace vigil {

DebounceBatcher::DebounceBatcher()
    : work_(boost::asio::make_work_guard(ioc_))
{
    running_ = true;
    io_thread_ = std::thread([this]() {
        ioc_.run();
    });
}

DebounceBatcher::~DebounceBatcher() {
    stop();
}

void DebounceBatcher::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    work_.reset();
    ioc_.stop();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    io_stopped_ = true;

    // io thread is gone, state is ours now
    if (!batches_.empty()) {
        std::size_t dropped = 0;
        for (const auto& [key, batch] : batches_) {
            dropped += batch.events.size();
        }
        spdlog::warn("Batcher stopped with {} pending batches ({} events) undelivered",
                     batches_.size(), dropped);
    }
    batches_.clear();
}

void DebounceBatcher::add_to_batch(
    Ticker key,
    TriggerEvent event,
    std::chrono::milliseconds window,
    BatchCallback on_ready
) {
    if (!running_.load()) {
        spdlog::warn("Batcher stopped, dropping event {} for {}", event.id, key);
        return;
    }

    boost::asio::post(ioc_,
        [this, key = std::move(key), event = std::move(event), window,
         on_ready = std::move(on_ready)]() mutable {
            arm(std::move(key), std::move(event), window, std::move(on_ready));
        });
}

void DebounceBatcher::arm(
    Ticker key,
    TriggerEvent event,
    std::chrono::milliseconds window,
    BatchCallback on_ready
) {
    auto& batch = batches_[key];
    batch.events.push_back(std::move(event));
    batch.on_ready = std::move(on_ready);
    batch.generation = ++next_generation_;

    if (!batch.timer) {
        batch.timer = std::make_unique<boost::asio::steady_timer>(ioc_);
    }

    // Re-arming aborts the previous wait; the generation guards against an
    // expiry that was already queued before the re-arm
    batch.timer->expires_after(window);
    batch.timer->async_wait(
        [this, key, generation = batch.generation](const boost::system::error_code& ec) {
            on_timer(key, generation, ec);
        });

    spdlog::debug("Batch {} now holds {} events, flushing in {}ms",
                  key, batch.events.size(), window.count());
}

void DebounceBatcher::on_timer(
    const Ticker& key,
    std::uint64_t generation,
    const boost::system::error_code& ec
) {
    if (ec) {
        return;  // Cancelled by a re-arm or flush
    }

    auto it = batches_.find(key);
    if (it == batches_.end() || it->second.generation != generation) {
        return;  // Superseded
    }

    // Clear state before delivering so a throwing callback cannot leave it behind
    auto events = std::move(it->second.events);
    auto on_ready = std::move(it->second.on_ready);
    batches_.erase(it);

    if (!events.empty()) {
        deliver(key, events, on_ready);
    }
}

void DebounceBatcher::flush_all(const BatchCallback& on_ready) {
    if (!running_.load()) {
        return;
    }
    run_sync([this, &on_ready]() {
        flush_now(on_ready);
    });
}

void DebounceBatcher::flush_now(const BatchCallback& on_ready) {
    auto pending = std::move(batches_);
    batches_.clear();

    for (auto& [key, batch] : pending) {
        if (batch.timer) {
            batch.timer->cancel();
        }
        if (!batch.events.empty()) {
            deliver(key, batch.events, on_ready);
        }
    }

    if (!pending.empty()) {
        spdlog::debug("Flushed {} batches", pending.size());
    }
}

std::size_t DebounceBatcher::pending_keys() const {
    std::size_t count = 0;
    if (running_.load()) {
        run_sync([this, &count]() {
            count = batches_.size();
        });
    }
    return count;
}

std::size_t DebounceBatcher::pending_events(const Ticker& key) const {
    std::size_t count = 0;
    if (running_.load()) {
        run_sync([this, &key, &count]() {
            auto it = batches_.find(key);
            if (it != batches_.end()) {
                count = it->second.events.size();
            }
        });
    }
    return count;
}

bool DebounceBatcher::is_running() const noexcept {
    return running_.load();
}

void DebounceBatcher::run_sync(const std::function<void()>& fn) const {
    if (ioc_.get_executor().running_in_this_thread()) {
        fn();
        return;
    }

    std::promise<void> done;
    auto finished = done.get_future();
    boost::asio::post(ioc_, [&fn, &done]() {
        try {
            fn();
            done.set_value();
        } catch (...) {
            done.set_exception(std::current_exception());
        }
    });

    // A stop() racing with this call leaves the handler queued forever
    while (finished.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready) {
        if (io_stopped_.load()) {
            if (finished.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                spdlog::warn("Batcher stopped before a synchronous request could run");
                return;
            }
            break;
        }
    }
    finished.get();
}

void DebounceBatcher::deliver(
    const Ticker& key,
    const std::vector<TriggerEvent>& events,
    const BatchCallback& on_ready
) {
    if (!on_ready) {
        spdlog::warn("No delivery callback for batch {}, dropping {} events", key, events.size());
        return;
    }
    try {
        on_ready(key, events);
    } catch (const std::exception& e) {
        spdlog::error("Batch delivery for {} failed: {}", key, e.what());
    } catch (...) {
        spdlog::error("Batch delivery for {} failed: unknown exception", key);
    }
}

}  // namespace vigil
