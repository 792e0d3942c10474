#pragma once

#include "alert/alert.hpp"
#include "market/types.hpp"
#include <string>
#include <vector>

namespace vigil {

/// Outcome of a single condition
struct ConditionVerdict {
    bool matched{false};
    std::string description;
};

/// Outcome of an evaluation path (condition groups, news trigger, anomaly)
struct EvaluationResult {
    bool triggered{false};
    std::string reason;
    std::vector<std::string> conditions_met;
};

/// Evaluates conditions and condition groups against an observation
/// Stateless apart from the tolerance; safe to share between threads
class ConditionEvaluator {
public:
    /// @param equality_tolerance Absolute tolerance for EQUAL / NOT_EQUAL
    explicit ConditionEvaluator(double equality_tolerance = kEqualityTolerance);

    /// Compare a resolved value against a threshold
    /// CROSSES_ABOVE / CROSSES_BELOW need the previous tick's value, which is
    /// not threaded through evaluation, so they never match.
    [[nodiscard]] bool compare(double actual, Operator op, double target) const noexcept;

    /// Evaluate one condition; unavailable or unknown fields never match
    [[nodiscard]] ConditionVerdict evaluate(
        const Condition& condition,
        const MarketObservation& market,
        const NewsContext* news
    ) const;

    /// Evaluate condition groups. Fires when any group is satisfied; conditions_met
    /// lists the matched conditions of satisfied groups only.
    [[nodiscard]] EvaluationResult evaluate_groups(
        const std::vector<ConditionGroup>& groups,
        const MarketObservation& market,
        const NewsContext* news
    ) const;

    [[nodiscard]] double tolerance() const noexcept;

private:
    double tolerance_;
};

}  // namespace vigil
