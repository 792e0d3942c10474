#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace vigil {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer within [min_val, max_val]
std::optional<int> get_env_int(const char* name, int min_val = std::numeric_limits<int>::min(),
                               int max_val = std::numeric_limits<int>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        int result = std::stoi(*value);
        if (result < min_val || result > max_val) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid integer value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Get environment variable as double within [min_val, max_val]
std::optional<double> get_env_double(const char* name, double min_val, double max_val) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        double result = std::stod(*value);
        if (result < min_val || result > max_val) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid number for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    // Engine
    if (auto v = get_env_int("VIGIL_WORKER_THREADS", 1, 256)) {
        config.engine.worker_threads = static_cast<std::size_t>(*v);
    }
    // Tick interval: 100ms to 1 day
    if (auto v = get_env_int("VIGIL_TICK_INTERVAL_MS", 100, 86400000)) {
        config.engine.tick_interval = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env_int("VIGIL_MIN_HISTORY_POINTS", 2, 100000)) {
        config.engine.min_history_points = static_cast<std::size_t>(*v);
    }

    // Sentiment
    if (auto v = get_env_double("VIGIL_NEWS_TRIGGER_THRESHOLD", -1.0, 1.0)) {
        config.sentiment.news_trigger_threshold = *v;
    }

    // Anomaly defaults
    if (auto v = get_env_double("VIGIL_ANOMALY_PRICE_CHANGE", 0.01, 100.0)) {
        config.anomaly.price_change_threshold = *v;
    }
    if (auto v = get_env_double("VIGIL_ANOMALY_VOLUME_MULTIPLIER", 1.0, 100.0)) {
        config.anomaly.volume_spike_multiplier = *v;
    }
    if (auto v = get_env_double("VIGIL_ANOMALY_SIGMA", 0.5, 5.0)) {
        config.anomaly.statistical_sigma = *v;
    }

    // Batching window: 1 minute to 1 day
    if (auto v = get_env_int("VIGIL_BATCH_WINDOW_MINUTES", 1, 1440)) {
        config.batching.default_window = std::chrono::minutes(*v);
    }

    // Input
    if (auto v = get_env("VIGIL_RULES_PATH")) {
        config.input.rules_path = *v;
    }
    if (auto v = get_env("VIGIL_FEED_PATH")) {
        config.input.feed_path = *v;
    }

    if (auto v = get_env("VIGIL_LOG_LEVEL")) {
        config.logging.level = *v;
    }
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    Config config = Config::defaults();

    try {
        if (j.contains("engine")) {
            const auto& eng = j["engine"];
            if (eng.contains("worker_threads")) {
                config.engine.worker_threads = eng["worker_threads"].get<std::size_t>();
            }
            if (eng.contains("tick_interval_ms")) {
                config.engine.tick_interval =
                    std::chrono::milliseconds(eng["tick_interval_ms"].get<int>());
            }
            if (eng.contains("equality_tolerance")) {
                config.engine.equality_tolerance = eng["equality_tolerance"].get<double>();
            }
            if (eng.contains("min_history_points")) {
                config.engine.min_history_points = eng["min_history_points"].get<std::size_t>();
            }
        }

        if (j.contains("sentiment")) {
            const auto& sen = j["sentiment"];
            if (sen.contains("news_trigger_threshold")) {
                config.sentiment.news_trigger_threshold =
                    sen["news_trigger_threshold"].get<double>();
            }
            if (sen.contains("keyword_weight")) {
                config.sentiment.keyword_weight = sen["keyword_weight"].get<double>();
            }
            if (sen.contains("negative_keywords")) {
                config.sentiment.negative_keywords =
                    sen["negative_keywords"].get<std::vector<std::string>>();
            }
            if (sen.contains("positive_keywords")) {
                config.sentiment.positive_keywords =
                    sen["positive_keywords"].get<std::vector<std::string>>();
            }
        }

        if (j.contains("anomaly")) {
            const auto& an = j["anomaly"];
            if (an.contains("price_change_threshold")) {
                config.anomaly.price_change_threshold = an["price_change_threshold"].get<double>();
            }
            if (an.contains("volume_spike_multiplier")) {
                config.anomaly.volume_spike_multiplier = an["volume_spike_multiplier"].get<double>();
            }
            if (an.contains("statistical_sigma")) {
                config.anomaly.statistical_sigma = an["statistical_sigma"].get<double>();
            }
            if (an.contains("requires_no_news")) {
                config.anomaly.requires_no_news = an["requires_no_news"].get<bool>();
            }
            if (an.contains("news_lookback_hours")) {
                config.anomaly.news_lookback =
                    std::chrono::hours(an["news_lookback_hours"].get<int>());
            }
        }

        if (j.contains("batching")) {
            const auto& bat = j["batching"];
            if (bat.contains("default_window_minutes")) {
                config.batching.default_window =
                    std::chrono::minutes(bat["default_window_minutes"].get<int>());
            }
        }

        if (j.contains("input")) {
            const auto& in = j["input"];
            if (in.contains("rules_path")) {
                config.input.rules_path = in["rules_path"].get<std::string>();
            }
            if (in.contains("feed_path")) {
                config.input.feed_path = in["feed_path"].get<std::string>();
            }
        }

        if (j.contains("logging")) {
            const auto& log = j["logging"];
            if (log.contains("level")) {
                config.logging.level = log["level"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_err()) {
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error()
                      << " (using defaults with env overrides)" << std::endl;
        }
        config = result.value_or(std::move(config));
    }

    apply_env_overrides(config);

    return config;
}

}  // namespace vigil
