#include "eval/anomaly_detector.hpp"
#include "eval/field_resolver.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace vigil {

std::optional<PriceStatistics> compute_price_statistics(const PriceHistory& history) {
    if (history.empty()) {
        return std::nullopt;
    }

    const auto n = static_cast<double>(history.size());

    double sum = 0.0;
    for (const auto& point : history) {
        sum += point.price;
    }
    const double mean = sum / n;

    double sq_sum = 0.0;
    for (const auto& point : history) {
        const double d = point.price - mean;
        sq_sum += d * d;
    }

    return PriceStatistics{
        .mean = mean,
        .std_dev = std::sqrt(sq_sum / n),
        .count = history.size()
    };
}

AnomalyDetector::AnomalyDetector(std::size_t min_history_points)
    : min_history_points_(min_history_points)
{}

AnomalyReport AnomalyDetector::evaluate(
    const AnomalyConfig& config,
    const MarketObservation& market,
    const NewsContext* news,
    const PriceHistory* history,
    Timestamp as_of
) const {
    AnomalyReport report;
    auto& met = report.result.conditions_met;

    // 1. Price shock (a zero previous close reads as no change)
    report.price_change = price_change_percent(market).value_or(0.0);
    report.price_shock = std::abs(report.price_change) >= config.price_change_threshold;
    if (report.price_shock) {
        met.push_back(fmt::format("Price change: {:.2f}% (threshold: {}%)",
                                  report.price_change, config.price_change_threshold));
    }

    // 2. Volume shock, skipped without an average
    if (market.average_volume && *market.average_volume > 0.0) {
        report.volume_multiple = market.volume / *market.average_volume;
        report.volume_shock =
            market.volume >= *market.average_volume * config.volume_spike_multiplier;
        if (report.volume_shock) {
            met.push_back(fmt::format("Volume spike: {:.1f}x average", *report.volume_multiple));
        }
    }

    // 3. Statistical outlier, needs enough history and a non-zero spread
    if (history != nullptr && history->size() >= min_history_points_) {
        const auto stats = compute_price_statistics(*history);
        if (stats && stats->std_dev > 0.0) {
            report.z_score = std::abs(market.price - stats->mean) / stats->std_dev;
            report.statistical_outlier = *report.z_score >= config.statistical_sigma;
            if (report.statistical_outlier) {
                met.push_back(fmt::format("Statistical outlier: {:.2f}σ from mean", *report.z_score));
            }
        } else if (stats) {
            spdlog::debug("Flat price history for {}, skipping z-score", market.ticker);
        }
    } else {
        spdlog::debug("Insufficient history for {} ({} points), skipping z-score",
                      market.ticker, history != nullptr ? history->size() : 0);
    }

    if (!report.present()) {
        report.result.reason = "No anomaly detected";
        return report;
    }

    // 4. News policy: an anomaly that news explains is reported but not triggered
    if (config.requires_no_news &&
        has_recent_news(news, as_of, config.news_lookback)) {
        report.explained_by_news = true;
        report.result.reason = "Anomaly detected but explained by news";
        return report;
    }

    report.result.triggered = true;
    std::string joined;
    for (std::size_t i = 0; i < met.size(); ++i) {
        joined += (i > 0 ? "; " : "") + met[i];
    }
    report.result.reason = "Anomaly detected: " + joined;
    return report;
}

bool AnomalyDetector::has_recent_news(
    const NewsContext* news,
    Timestamp as_of,
    std::chrono::hours lookback
) {
    if (news == nullptr) {
        return false;
    }
    if (news->articles.empty()) {
        return news->article_count > 0;
    }

    const Timestamp cutoff = as_of - lookback;
    return std::any_of(news->articles.begin(), news->articles.end(),
        [cutoff](const NewsItem& item) {
            return !item.published_at || *item.published_at >= cutoff;
        });
}

std::size_t AnomalyDetector::min_history_points() const noexcept {
    return min_history_points_;
}

}  // namespace vigil
