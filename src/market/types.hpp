#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil {

/// One market snapshot for a ticker, supplied per evaluation tick
struct MarketObservation {
    Ticker ticker;
    Price price{0.0};
    Price previous_close{0.0};
    Volume volume{0.0};
    std::optional<Volume> average_volume;
    std::optional<double> pe_ratio;
    std::optional<double> rsi;
    std::optional<Price> moving_avg_50;
    std::optional<Price> moving_avg_200;
    std::optional<double> market_cap;
    Timestamp observed_at;
};

/// A news article as delivered by the news poller
struct NewsItem {
    std::string title;
    std::string summary;
    std::optional<Timestamp> published_at;
};

/// News for a ticker over the poller's lookback window
struct NewsContext {
    Ticker ticker;
    std::vector<NewsItem> articles;
    std::size_t article_count{0};
    std::optional<double> average_sentiment;  // [-1, 1]
};

/// Rolling price history entry (oldest first)
struct PriceHistoryPoint {
    Timestamp at;
    Price price{0.0};
    Volume volume{0.0};
};

using PriceHistory = std::vector<PriceHistoryPoint>;

/// Everything the poller supplies for one evaluation tick, keyed by ticker
struct TickSnapshot {
    std::optional<Timestamp> at;  // Evaluation instant; wall clock when absent
    std::unordered_map<Ticker, MarketObservation> market;
    std::unordered_map<Ticker, NewsContext> news;
    std::unordered_map<Ticker, PriceHistory> history;
};

}  // namespace vigil
