#pragma once

#include "alert/alert.hpp"
#include "eval/condition_evaluator.hpp"
#include "market/types.hpp"
#include <chrono>
#include <cstddef>
#include <optional>

namespace vigil {

/// Population statistics over a price history
struct PriceStatistics {
    double mean{0.0};
    double std_dev{0.0};
    std::size_t count{0};
};

/// Compute population mean and standard deviation of historical prices
/// @return nullopt for an empty history
[[nodiscard]] std::optional<PriceStatistics> compute_price_statistics(const PriceHistory& history);

/// Full anomaly evaluation, including the raw signals for diagnostics
struct AnomalyReport {
    Percent price_change{0.0};
    std::optional<double> volume_multiple;  // volume / average, when an average exists
    std::optional<double> z_score;          // when enough history and non-zero spread

    bool price_shock{false};
    bool volume_shock{false};
    bool statistical_outlier{false};
    bool explained_by_news{false};

    /// Whether any signal fired, regardless of news suppression
    [[nodiscard]] bool present() const noexcept {
        return price_shock || volume_shock || statistical_outlier;
    }

    // Triggered only when present and not suppressed by news
    EvaluationResult result;
};

/// Detects price shocks, volume shocks and statistical outliers
class AnomalyDetector {
public:
    /// @param min_history_points History length needed for the z-score signal
    explicit AnomalyDetector(std::size_t min_history_points = kMinHistoryPoints);

    /// Evaluate an observation against an anomaly config
    /// @param config Thresholds and news policy
    /// @param market Current observation
    /// @param news News for the ticker, may be null
    /// @param history Rolling price history (oldest first), may be null
    /// @param as_of End of the news lookback window
    /// @return Report; result.triggered is false when news explains the move
    [[nodiscard]] AnomalyReport evaluate(
        const AnomalyConfig& config,
        const MarketObservation& market,
        const NewsContext* news,
        const PriceHistory* history,
        Timestamp as_of
    ) const;

    /// True when the context holds news inside the lookback window ending at `as_of`.
    /// Articles without a publish time count as recent; a bare count is trusted
    /// when no articles are attached.
    [[nodiscard]] static bool has_recent_news(
        const NewsContext* news,
        Timestamp as_of,
        std::chrono::hours lookback
    );

    [[nodiscard]] std::size_t min_history_points() const noexcept;

private:
    std::size_t min_history_points_;
};

}  // namespace vigil
