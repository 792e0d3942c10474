#include "engine/alert_service.hpp"
#include "feed/rule_codec.hpp"
#include "output/json_formatter.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace vigil {

AlertService::AlertService(const Config& config)
    : config_(config)
    , engine_(config)
    , runner_(
          engine_,
          history_,
          batcher_,
          [this](const Ticker& ticker, const std::vector<TriggerEvent>& events) {
              deliver(ticker, events);
          },
          config.engine.worker_threads,
          config.batching.default_window)
    , tick_timer_(ioc_)
{
    setup_logging();

    console_ = std::make_unique<output::ConsoleLogger>(std::chrono::seconds(10));
}

AlertService::~AlertService() {
    request_shutdown();
    batcher_.stop();
}

void AlertService::setup_logging() {
    // Initialize async logging to avoid blocking evaluation workers
    spdlog::init_thread_pool(8192, 1);

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::async_logger>(
        "vigil",
        stdout_sink,
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    auto level = spdlog::level::from_str(config_.logging.level);
    if (level == spdlog::level::off && config_.logging.level != "off") {
        spdlog::warn("Unknown log level '{}', using info", config_.logging.level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);

    // Notifications: one bare JSON line per batch, same console lock as the log
    delivery_log_ = std::make_shared<spdlog::async_logger>(
        "vigil.delivery",
        std::make_shared<spdlog::sinks::stdout_sink_mt>(),
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::block
    );
    delivery_log_->set_pattern("%v");
    delivery_log_->set_level(spdlog::level::info);
}

bool AlertService::run() {
    spdlog::info("Starting vigil alert engine");

    if (!load_inputs()) {
        return false;
    }
    score_news();

    spdlog::info("Rules: {} alerts from {}", alerts_.size(), config_.input.rules_path);
    spdlog::info("Feed: {} ticks from {}", feed_.size(), config_.input.feed_path);

    schedule_tick(std::chrono::milliseconds(0));

    while (!shutdown_requested_.load()) {
        try {
            ioc_.run_for(std::chrono::milliseconds(100));
            ioc_.restart();
        } catch (const std::exception& e) {
            spdlog::error("Tick loop exception: {}", e.what());
        }
    }

    tick_timer_.cancel();

    // Anything still inside a batching window goes out now
    batcher_.flush_all([this](const Ticker& ticker, const std::vector<TriggerEvent>& events) {
        deliver(ticker, events);
    });
    batcher_.stop();

    spdlog::info("Shutdown complete: {} ticks, {} batches, {} events delivered",
                 next_tick_, batches_delivered_.load(), events_delivered_.load());

    delivery_log_->flush();
    spdlog::default_logger()->flush();
    return true;
}

bool AlertService::load_inputs() {
    auto alerts = feed::RuleCodec::load_alerts(config_.input.rules_path);
    if (alerts.is_err()) {
        spdlog::error("Failed to load rules: {}", alerts.error());
        return false;
    }
    alerts_ = std::move(alerts).take_value();

    auto ticks = feed::RuleCodec::load_feed(config_.input.feed_path);
    if (ticks.is_err()) {
        spdlog::error("Failed to load feed: {}", ticks.error());
        return false;
    }
    feed_ = std::move(ticks).take_value();
    return true;
}

void AlertService::score_news() {
    // The poller leaves scoring to us when it has only raw articles
    for (auto& tick : feed_) {
        for (auto& [ticker, news] : tick.news) {
            if (!news.average_sentiment && !news.articles.empty()) {
                news.average_sentiment = engine_.sentiment().average_sentiment(news.articles);
            }
        }
    }
}

void AlertService::schedule_tick(std::chrono::milliseconds delay) {
    tick_timer_.expires_after(delay);
    tick_timer_.async_wait([this](const boost::system::error_code& ec) {
        on_tick(ec);
    });
}

void AlertService::on_tick(const boost::system::error_code& ec) {
    if (ec) {
        return;  // Cancelled
    }

    if (next_tick_ >= feed_.size()) {
        spdlog::info("Feed exhausted");
        shutdown_requested_.store(true);
        return;
    }

    const auto& snapshot = feed_[next_tick_];
    const Timestamp now = snapshot.at.value_or(std::chrono::system_clock::now());

    auto report = runner_.run(alerts_, snapshot, now);
    ++next_tick_;

    console_->log_tick_report(report);
    spdlog::debug("{}", output::JsonFormatter::format_tick_report(report).dump());

    // Keep one day of history for the daily cap
    history_.prune_before(now - std::chrono::hours(24));

    schedule_tick(std::chrono::duration_cast<std::chrono::milliseconds>(config_.engine.tick_interval));
}

void AlertService::deliver(const Ticker& ticker, const std::vector<TriggerEvent>& events) {
    console_->log_batch(ticker, events);
    delivery_log_->info(output::JsonFormatter::format_batch(ticker, events).dump());

    batches_delivered_.fetch_add(1);
    events_delivered_.fetch_add(events.size());
}

void AlertService::request_shutdown() {
    shutdown_requested_.store(true);
    ioc_.stop();
}

std::size_t AlertService::ticks_run() const noexcept {
    return next_tick_;
}

std::size_t AlertService::batches_delivered() const noexcept {
    return batches_delivered_.load();
}

std::size_t AlertService::events_delivered() const noexcept {
    return events_delivered_.load();
}

const InMemoryTriggerHistory& AlertService::trigger_history() const noexcept {
    return history_;
}

}  // namespace vigil
