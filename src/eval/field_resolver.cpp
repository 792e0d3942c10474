#include "eval/field_resolver.hpp"
#include <array>
#include <cstddef>

namespace vigil {

namespace {

using Extractor = std::optional<double> (*)(const MarketObservation&, const NewsContext*) noexcept;

std::optional<double> price(const MarketObservation& m, const NewsContext*) noexcept {
    return m.price;
}

std::optional<double> price_change(const MarketObservation& m, const NewsContext*) noexcept {
    return price_change_percent(m);
}

std::optional<double> volume(const MarketObservation& m, const NewsContext*) noexcept {
    return m.volume;
}

std::optional<double> volume_ratio(const MarketObservation& m, const NewsContext*) noexcept {
    if (!m.average_volume || *m.average_volume <= 0.0) {
        return std::nullopt;
    }
    return m.volume / *m.average_volume;
}

std::optional<double> pe_ratio(const MarketObservation& m, const NewsContext*) noexcept {
    return m.pe_ratio;
}

std::optional<double> rsi(const MarketObservation& m, const NewsContext*) noexcept {
    return m.rsi;
}

std::optional<double> moving_avg_50(const MarketObservation& m, const NewsContext*) noexcept {
    return m.moving_avg_50;
}

std::optional<double> moving_avg_200(const MarketObservation& m, const NewsContext*) noexcept {
    return m.moving_avg_200;
}

std::optional<double> news_sentiment(const MarketObservation&, const NewsContext* n) noexcept {
    if (n == nullptr) {
        return std::nullopt;
    }
    return n->average_sentiment;
}

std::optional<double> market_cap(const MarketObservation& m, const NewsContext*) noexcept {
    return m.market_cap;
}

// Indexed by ConditionField, order must match the enum
constexpr std::array<Extractor, 10> kExtractors{
    price,
    price_change,
    volume,
    volume_ratio,
    pe_ratio,
    rsi,
    moving_avg_50,
    moving_avg_200,
    news_sentiment,
    market_cap,
};

static_assert(kExtractors.size() == static_cast<std::size_t>(ConditionField::Unknown),
              "every ConditionField needs an extractor");
static_assert(kExtractors.size() == kConditionFieldNames.size());

}  // namespace

std::optional<Percent> price_change_percent(const MarketObservation& market) noexcept {
    if (market.previous_close == 0.0) {
        return std::nullopt;
    }
    return (market.price - market.previous_close) / market.previous_close * 100.0;
}

std::optional<double> resolve_field(
    ConditionField field,
    const MarketObservation& market,
    const NewsContext* news
) noexcept {
    const auto index = static_cast<std::size_t>(field);
    if (index >= kExtractors.size()) {
        return std::nullopt;
    }
    return kExtractors[index](market, news);
}

}  // namespace vigil
