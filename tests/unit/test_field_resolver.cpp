#include <gtest/gtest.h>
#include "eval/field_resolver.hpp"

using namespace vigil;

class FieldResolverTest : public ::testing::Test {
protected:
    MarketObservation market{
        .ticker = "SBER",
        .price = 110.0,
        .previous_close = 100.0,
        .volume = 3000.0,
        .average_volume = 1000.0,
        .pe_ratio = 4.5,
        .rsi = 72.0,
    };
};

TEST_F(FieldResolverTest, PriceAndVolumeAreAlwaysAvailable) {
    EXPECT_DOUBLE_EQ(*resolve_field(ConditionField::Price, market, nullptr), 110.0);
    EXPECT_DOUBLE_EQ(*resolve_field(ConditionField::Volume, market, nullptr), 3000.0);
}

TEST_F(FieldResolverTest, PriceChangeIsPercentOfPreviousClose) {
    EXPECT_DOUBLE_EQ(*resolve_field(ConditionField::PriceChange, market, nullptr), 10.0);

    market.price = 95.0;
    EXPECT_DOUBLE_EQ(*resolve_field(ConditionField::PriceChange, market, nullptr), -5.0);
}

TEST_F(FieldResolverTest, PriceChangeUnavailableWithoutPreviousClose) {
    market.previous_close = 0.0;
    EXPECT_FALSE(price_change_percent(market).has_value());
    EXPECT_FALSE(resolve_field(ConditionField::PriceChange, market, nullptr).has_value());
}

TEST_F(FieldResolverTest, VolumeRatioNeedsPositiveAverage) {
    EXPECT_DOUBLE_EQ(*resolve_field(ConditionField::VolumeRatio, market, nullptr), 3.0);

    market.average_volume = 0.0;
    EXPECT_FALSE(resolve_field(ConditionField::VolumeRatio, market, nullptr).has_value());

    market.average_volume.reset();
    EXPECT_FALSE(resolve_field(ConditionField::VolumeRatio, market, nullptr).has_value());
}

TEST_F(FieldResolverTest, OptionalFieldsAreNeverSilentZero) {
    EXPECT_DOUBLE_EQ(*resolve_field(ConditionField::PeRatio, market, nullptr), 4.5);
    EXPECT_DOUBLE_EQ(*resolve_field(ConditionField::Rsi, market, nullptr), 72.0);
    EXPECT_FALSE(resolve_field(ConditionField::MovingAvg50, market, nullptr).has_value());
    EXPECT_FALSE(resolve_field(ConditionField::MovingAvg200, market, nullptr).has_value());
    EXPECT_FALSE(resolve_field(ConditionField::MarketCap, market, nullptr).has_value());
}

TEST_F(FieldResolverTest, NewsSentimentComesFromNewsContext) {
    EXPECT_FALSE(resolve_field(ConditionField::NewsSentiment, market, nullptr).has_value());

    NewsContext news{.ticker = "SBER", .article_count = 2};
    EXPECT_FALSE(resolve_field(ConditionField::NewsSentiment, market, &news).has_value());

    news.average_sentiment = -0.4;
    EXPECT_DOUBLE_EQ(*resolve_field(ConditionField::NewsSentiment, market, &news), -0.4);
}

TEST_F(FieldResolverTest, UnknownFieldNeverResolves) {
    EXPECT_FALSE(resolve_field(ConditionField::Unknown, market, nullptr).has_value());
}
