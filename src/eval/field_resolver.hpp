#pragma once

#include "alert/enums.hpp"
#include "market/types.hpp"
#include <optional>

namespace vigil {

/// Percentage change of price versus previous close
/// @return nullopt when previous close is zero
[[nodiscard]] std::optional<Percent> price_change_percent(const MarketObservation& market) noexcept;

/// Extract a condition field from the current observation
/// @param field Field to read
/// @param market Current market observation
/// @param news News context for the ticker, may be null
/// @return Value, or nullopt when the field is unavailable (never a silent zero)
[[nodiscard]] std::optional<double> resolve_field(
    ConditionField field,
    const MarketObservation& market,
    const NewsContext* news
) noexcept;

}  // namespace vigil
