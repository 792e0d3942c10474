#include "eval/condition_evaluator.hpp"
#include "eval/field_resolver.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace vigil {

namespace {

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

}  // namespace

ConditionEvaluator::ConditionEvaluator(double equality_tolerance)
    : tolerance_(equality_tolerance)
{}

bool ConditionEvaluator::compare(double actual, Operator op, double target) const noexcept {
    switch (op) {
        case Operator::GreaterThan:      return actual > target;
        case Operator::LessThan:         return actual < target;
        case Operator::GreaterEqual:     return actual >= target;
        case Operator::LessEqual:        return actual <= target;
        case Operator::Equal:            return std::abs(actual - target) < tolerance_;
        case Operator::NotEqual:         return std::abs(actual - target) >= tolerance_;
        case Operator::PercentageChange: return std::abs(actual) >= target;
        case Operator::CrossesAbove:
        case Operator::CrossesBelow:
        case Operator::Unknown:
            return false;
    }
    return false;
}

ConditionVerdict ConditionEvaluator::evaluate(
    const Condition& condition,
    const MarketObservation& market,
    const NewsContext* news
) const {
    if (condition.field == ConditionField::Unknown) {
        spdlog::warn("Condition {} on {} references an unknown field, treating as unmatched",
                     condition.id, market.ticker);
        return {false, "unknown field"};
    }

    const auto value = resolve_field(condition.field, market, news);
    if (!value) {
        spdlog::debug("{} unavailable for {}", to_string(condition.field), market.ticker);
        return {false, fmt::format("{} data unavailable", to_string(condition.field))};
    }

    if (condition.op == Operator::Unknown) {
        spdlog::warn("Condition {} on {} uses an unknown operator, treating as unmatched",
                     condition.id, market.ticker);
        return {false, fmt::format("{} unsupported operator", to_string(condition.field))};
    }

    const bool matched = compare(*value, condition.op, condition.threshold);

    auto description = std::isfinite(*value)
        ? fmt::format("{} {} {} (actual: {:.2f})", to_string(condition.field),
                      operator_symbol(condition.op), condition.threshold, *value)
        : fmt::format("{} {} {} (actual: N/A)", to_string(condition.field),
                      operator_symbol(condition.op), condition.threshold);

    return {matched, std::move(description)};
}

EvaluationResult ConditionEvaluator::evaluate_groups(
    const std::vector<ConditionGroup>& groups,
    const MarketObservation& market,
    const NewsContext* news
) const {
    EvaluationResult result;

    for (const auto& group : groups) {
        if (group.conditions.empty()) {
            continue;  // An empty group is never satisfied
        }

        std::vector<ConditionVerdict> verdicts;
        verdicts.reserve(group.conditions.size());
        for (const auto& condition : group.conditions) {
            verdicts.push_back(evaluate(condition, market, news));
        }

        auto is_matched = [](const ConditionVerdict& v) { return v.matched; };
        const bool satisfied = group.logic == Logic::And
            ? std::all_of(verdicts.begin(), verdicts.end(), is_matched)
            : std::any_of(verdicts.begin(), verdicts.end(), is_matched);

        if (!satisfied) {
            continue;
        }

        result.triggered = true;
        for (auto& verdict : verdicts) {
            if (verdict.matched) {
                result.conditions_met.push_back(std::move(verdict.description));
            }
        }
    }

    result.reason = result.triggered
        ? "Conditions met: " + join(result.conditions_met, ", ")
        : "No conditions met";

    return result;
}

double ConditionEvaluator::tolerance() const noexcept {
    return tolerance_;
}

}  // namespace vigil
