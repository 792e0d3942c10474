#pragma once

#include "alert/alert.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vigil {

/// Immutable configuration for vigil
struct Config {
    /// Evaluation engine configuration
    struct Engine {
        std::size_t worker_threads = 4;
        std::chrono::milliseconds tick_interval{60000};
        double equality_tolerance = kEqualityTolerance;
        std::size_t min_history_points = kMinHistoryPoints;
    };

    /// Keyword sentiment scoring
    struct Sentiment {
        double news_trigger_threshold = kNewsTriggerThreshold;
        double keyword_weight = kKeywordWeight;
        // Empty means the built-in keyword lists
        std::vector<std::string> negative_keywords;
        std::vector<std::string> positive_keywords;
    };

    /// Debounce batching
    struct Batching {
        // Used when an alert enables batching with a zero window
        std::chrono::minutes default_window{15};
    };

    /// Rule and replay-feed inputs for the service
    struct Input {
        std::string rules_path = "alerts.json";
        std::string feed_path = "feed.json";
    };

    struct Logging {
        std::string level = "info";
    };

    Engine engine;
    Sentiment sentiment;
    AnomalyConfig anomaly;  // Default for ANOMALY alerts without their own config
    Batching batching;
    Input input;
    Logging logging;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    /// @param config_path Optional path to JSON config file
    /// @return Loaded configuration
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);
};

}  // namespace vigil
