#pragma once

#include "alert/alert.hpp"
#include "core/status.hpp"
#include "market/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace vigil::feed {

/// Parser for rule files and replay feeds
/// Converts raw JSON (camelCase wire names, upper-snake enums, ISO8601 times) to typed structs
class RuleCodec {
public:
    /// Parse a rule set: {"alerts": [...]} or a bare array
    /// Alerts with an unrecognised type or status are skipped with a warning;
    /// malformed JSON or a missing id/ticker/type fails the whole set
    [[nodiscard]] static Result<std::vector<Alert>, std::string>
    parse_alerts(std::string_view json);

    /// Parse a replay feed: {"ticks": [{"at", "market", "news", "history"}, ...]}
    [[nodiscard]] static Result<std::vector<TickSnapshot>, std::string>
    parse_feed(std::string_view json);

    /// Read and parse a rule file
    [[nodiscard]] static Result<std::vector<Alert>, std::string>
    load_alerts(const std::string& path);

    /// Read and parse a replay feed file
    [[nodiscard]] static Result<std::vector<TickSnapshot>, std::string>
    load_feed(const std::string& path);
};

}  // namespace vigil::feed
