#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace vigil {

// Absolute instant; all engine inputs and outputs use wall-clock time
using Timestamp = std::chrono::system_clock::time_point;

// Instrument identifier (e.g., "SBER", "AAPL")
using Ticker = std::string;

// Alert rule identifier, owned by the rule-authoring layer
using AlertId = std::string;

// Trigger event identifier (UUID string)
using EventId = std::string;

using Price = double;
using Volume = double;

// Percentage expressed in percent units (15.0 == 15%)
using Percent = double;

// Absolute tolerance for EQUAL / NOT_EQUAL comparisons
constexpr double kEqualityTolerance = 0.01;

// Price points needed before the z-score signal is computed
constexpr std::size_t kMinHistoryPoints = 20;

// Sentiment below this fires a NEWS_TRIGGERED alert
constexpr double kNewsTriggerThreshold = -0.3;

// Per-keyword contribution to an article's sentiment score
constexpr double kKeywordWeight = 0.2;

}  // namespace vigil
