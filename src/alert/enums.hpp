#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace vigil {

/// Which evaluation path an alert takes
enum class AlertType {
    Threshold,       // Single condition group (price > X)
    MultiCondition,  // Several groups, OR-combined
    NewsTriggered,   // Negative news sentiment
    Anomaly          // Price/volume shock or statistical outlier
};

enum class AlertStatus {
    Active,     // Being evaluated
    Triggered,  // Fired, notification handed off
    Snoozed,    // Paused until snoozed_until
    Dismissed,  // Closed by the user
    Expired,    // Past expires_at
    Disabled    // Switched off by the user
};

enum class AlertPriority {
    Low,
    Medium,
    High,
    Critical
};

/// How the conditions of one group combine
enum class Logic {
    And,
    Or
};

/// Observation field a condition reads
enum class ConditionField {
    Price,
    PriceChange,    // % versus previous close
    Volume,
    VolumeRatio,    // volume / average volume
    PeRatio,
    Rsi,
    MovingAvg50,
    MovingAvg200,
    NewsSentiment,
    MarketCap,
    Unknown         // Malformed rule: never resolves
};

enum class Operator {
    GreaterThan,
    LessThan,
    GreaterEqual,
    LessEqual,
    Equal,             // |a - b| < tolerance
    NotEqual,          // |a - b| >= tolerance
    PercentageChange,  // |a| >= threshold
    CrossesAbove,      // Needs the previous tick's value, never matches
    CrossesBelow,      // Needs the previous tick's value, never matches
    Unknown            // Malformed rule: never matches
};

/// What the user did with a trigger event (owned by the UI layer)
enum class UserAction {
    Pending,
    Viewed,
    Dismissed,
    Snoozed
};

/// Wire names, matching the rule-authoring layer's JSON
template <typename Enum, std::size_t N>
using NameTable = std::array<std::pair<Enum, std::string_view>, N>;

inline constexpr NameTable<AlertType, 4> kAlertTypeNames{{
    {AlertType::Threshold, "THRESHOLD"},
    {AlertType::MultiCondition, "MULTI_CONDITION"},
    {AlertType::NewsTriggered, "NEWS_TRIGGERED"},
    {AlertType::Anomaly, "ANOMALY"},
}};

inline constexpr NameTable<AlertStatus, 6> kAlertStatusNames{{
    {AlertStatus::Active, "ACTIVE"},
    {AlertStatus::Triggered, "TRIGGERED"},
    {AlertStatus::Snoozed, "SNOOZED"},
    {AlertStatus::Dismissed, "DISMISSED"},
    {AlertStatus::Expired, "EXPIRED"},
    {AlertStatus::Disabled, "DISABLED"},
}};

inline constexpr NameTable<AlertPriority, 4> kAlertPriorityNames{{
    {AlertPriority::Low, "LOW"},
    {AlertPriority::Medium, "MEDIUM"},
    {AlertPriority::High, "HIGH"},
    {AlertPriority::Critical, "CRITICAL"},
}};

inline constexpr NameTable<Logic, 2> kLogicNames{{
    {Logic::And, "AND"},
    {Logic::Or, "OR"},
}};

inline constexpr NameTable<ConditionField, 10> kConditionFieldNames{{
    {ConditionField::Price, "PRICE"},
    {ConditionField::PriceChange, "PRICE_CHANGE"},
    {ConditionField::Volume, "VOLUME"},
    {ConditionField::VolumeRatio, "VOLUME_RATIO"},
    {ConditionField::PeRatio, "PE_RATIO"},
    {ConditionField::Rsi, "RSI"},
    {ConditionField::MovingAvg50, "MOVING_AVG_50"},
    {ConditionField::MovingAvg200, "MOVING_AVG_200"},
    {ConditionField::NewsSentiment, "NEWS_SENTIMENT"},
    {ConditionField::MarketCap, "MARKET_CAP"},
}};

inline constexpr NameTable<Operator, 9> kOperatorNames{{
    {Operator::GreaterThan, "GREATER_THAN"},
    {Operator::LessThan, "LESS_THAN"},
    {Operator::GreaterEqual, "GREATER_THAN_EQUAL"},
    {Operator::LessEqual, "LESS_THAN_EQUAL"},
    {Operator::Equal, "EQUAL"},
    {Operator::NotEqual, "NOT_EQUAL"},
    {Operator::PercentageChange, "PERCENTAGE_CHANGE"},
    {Operator::CrossesAbove, "CROSSES_ABOVE"},
    {Operator::CrossesBelow, "CROSSES_BELOW"},
}};

inline constexpr NameTable<UserAction, 4> kUserActionNames{{
    {UserAction::Pending, "PENDING"},
    {UserAction::Viewed, "VIEWED"},
    {UserAction::Dismissed, "DISMISSED"},
    {UserAction::Snoozed, "SNOOZED"},
}};

namespace detail {

template <typename Enum, std::size_t N>
[[nodiscard]] constexpr std::string_view name_of(const NameTable<Enum, N>& table, Enum value) noexcept {
    for (const auto& [key, name] : table) {
        if (key == value) {
            return name;
        }
    }
    return "UNKNOWN";
}

template <typename Enum, std::size_t N>
[[nodiscard]] constexpr std::optional<Enum> value_of(const NameTable<Enum, N>& table,
                                                     std::string_view name) noexcept {
    for (const auto& [key, entry] : table) {
        if (entry == name) {
            return key;
        }
    }
    return std::nullopt;
}

}  // namespace detail

[[nodiscard]] constexpr std::string_view to_string(AlertType v) noexcept {
    return detail::name_of(kAlertTypeNames, v);
}
[[nodiscard]] constexpr std::string_view to_string(AlertStatus v) noexcept {
    return detail::name_of(kAlertStatusNames, v);
}
[[nodiscard]] constexpr std::string_view to_string(AlertPriority v) noexcept {
    return detail::name_of(kAlertPriorityNames, v);
}
[[nodiscard]] constexpr std::string_view to_string(Logic v) noexcept {
    return detail::name_of(kLogicNames, v);
}
[[nodiscard]] constexpr std::string_view to_string(ConditionField v) noexcept {
    return detail::name_of(kConditionFieldNames, v);
}
[[nodiscard]] constexpr std::string_view to_string(Operator v) noexcept {
    return detail::name_of(kOperatorNames, v);
}
[[nodiscard]] constexpr std::string_view to_string(UserAction v) noexcept {
    return detail::name_of(kUserActionNames, v);
}

[[nodiscard]] constexpr std::optional<AlertType> parse_alert_type(std::string_view s) noexcept {
    return detail::value_of(kAlertTypeNames, s);
}
[[nodiscard]] constexpr std::optional<AlertStatus> parse_alert_status(std::string_view s) noexcept {
    return detail::value_of(kAlertStatusNames, s);
}
[[nodiscard]] constexpr std::optional<AlertPriority> parse_alert_priority(std::string_view s) noexcept {
    return detail::value_of(kAlertPriorityNames, s);
}
[[nodiscard]] constexpr std::optional<Logic> parse_logic(std::string_view s) noexcept {
    return detail::value_of(kLogicNames, s);
}

/// Unrecognised names decode to Unknown so one bad condition cannot reject a whole rule
[[nodiscard]] constexpr ConditionField parse_condition_field(std::string_view s) noexcept {
    return detail::value_of(kConditionFieldNames, s).value_or(ConditionField::Unknown);
}
[[nodiscard]] constexpr Operator parse_operator(std::string_view s) noexcept {
    return detail::value_of(kOperatorNames, s).value_or(Operator::Unknown);
}

/// Display symbol used in human-readable condition descriptions
[[nodiscard]] constexpr std::string_view operator_symbol(Operator op) noexcept {
    switch (op) {
        case Operator::GreaterThan:      return ">";
        case Operator::LessThan:         return "<";
        case Operator::GreaterEqual:     return "≥";
        case Operator::LessEqual:        return "≤";
        case Operator::Equal:            return "=";
        case Operator::NotEqual:         return "≠";
        case Operator::PercentageChange: return "%Δ";
        case Operator::CrossesAbove:     return "↑";
        case Operator::CrossesBelow:     return "↓";
        case Operator::Unknown:          return "?";
    }
    return "?";
}

}  // namespace vigil
