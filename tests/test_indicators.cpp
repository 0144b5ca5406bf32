#include <gtest/gtest.h>

#include "indicators.hpp"
#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "rsi_indicator.hpp"
#include "prev_indicator.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using indicators::IndicatorKind;

namespace {
    const double kNaN = std::numeric_limits<double>::quiet_NaN();
}

TEST(IndicatorRegistryTest, LooksUpByLowercaseName) {
    EXPECT_EQ(indicators::indicatorFromName("sma"), IndicatorKind::Sma);
    EXPECT_EQ(indicators::indicatorFromName("ema"), IndicatorKind::Ema);
    EXPECT_EQ(indicators::indicatorFromName("rsi"), IndicatorKind::Rsi);
    EXPECT_EQ(indicators::indicatorFromName("prev"), IndicatorKind::Prev);
    EXPECT_FALSE(indicators::indicatorFromName("macd").has_value());
    EXPECT_EQ(indicators::validIndicatorNames(), (std::vector<std::string>{"ema", "prev", "rsi", "sma"}));
}

TEST(IndicatorRegistryTest, SignaturesCarryDefaults) {
    auto sma = indicators::signatureOf(IndicatorKind::Sma);
    EXPECT_EQ(sma.required_args, 2u);
    EXPECT_EQ(sma.max_args, 2u);
    EXPECT_FALSE(sma.default_parameter.has_value());

    auto rsi = indicators::signatureOf(IndicatorKind::Rsi);
    EXPECT_EQ(rsi.required_args, 1u);
    EXPECT_EQ(rsi.max_args, 2u);
    ASSERT_TRUE(rsi.default_parameter.has_value());
    EXPECT_DOUBLE_EQ(*rsi.default_parameter, 14.0);

    auto prev = indicators::signatureOf(IndicatorKind::Prev);
    ASSERT_TRUE(prev.default_parameter.has_value());
    EXPECT_DOUBLE_EQ(*prev.default_parameter, 1.0);
}

TEST(IndicatorRegistryTest, CoercePeriodTruncatesFractions) {
    EXPECT_EQ(indicators::coercePeriod(20.0, "sma"), 20);
    EXPECT_EQ(indicators::coercePeriod(20.5, "sma"), 20);
    EXPECT_EQ(indicators::coercePeriod(2.99, "ema"), 2);
    EXPECT_EQ(indicators::coercePeriod(-1.5, "prev"), -1);
    EXPECT_THROW(indicators::coercePeriod(kNaN, "sma"), std::invalid_argument);
    EXPECT_THROW(indicators::coercePeriod(1e12, "sma"), std::invalid_argument);

    auto truncated = indicators::compute(IndicatorKind::Sma, {1, 2, 3}, 2.5);
    auto whole = indicators::compute(IndicatorKind::Sma, {1, 2, 3}, 2);
    ASSERT_EQ(truncated.size(), 3u);
    EXPECT_TRUE(std::isnan(truncated[0]));
    EXPECT_DOUBLE_EQ(truncated[1], whole[1]);
    EXPECT_DOUBLE_EQ(truncated[2], whole[2]);

    // 0.5 truncates to a zero period, which SMA rejects
    EXPECT_THROW(indicators::compute(IndicatorKind::Sma, {1, 2, 3}, 0.5), std::invalid_argument);
}

TEST(SmaIndicatorTest, AlignedWithWarmUp) {
    auto out = indicators::compute(IndicatorKind::Sma, {1, 2, 3, 4, 5}, 3);
    ASSERT_EQ(out.size(), 5u);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_DOUBLE_EQ(out[2], 2.0);
    EXPECT_DOUBLE_EQ(out[3], 3.0);
    EXPECT_DOUBLE_EQ(out[4], 4.0);
}

TEST(SmaIndicatorTest, WindowTouchingUndefinedInputIsUndefined) {
    indicators::SmaIndicator sma(2);
    EXPECT_EQ(sma.getName(), "SMA(2)");
    EXPECT_EQ(sma.getLookback(), 1);
    sma.calculate({kNaN, 2, 4, kNaN, 6, 8});
    const auto& out = sma.getResult();
    ASSERT_EQ(out.size(), 6u);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_DOUBLE_EQ(out[2], 3.0);
    EXPECT_TRUE(std::isnan(out[3]));
    EXPECT_TRUE(std::isnan(out[4]));
    EXPECT_DOUBLE_EQ(out[5], 7.0);
}

TEST(SmaIndicatorTest, ShortInputIsAllUndefined) {
    auto out = indicators::compute(IndicatorKind::Sma, {1, 2}, 5);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_THROW(indicators::SmaIndicator(0), std::invalid_argument);
}

TEST(EmaIndicatorTest, RecursiveWithoutAdjustment) {
    // alpha = 2 / (3 + 1) = 0.5, seeded with the first value
    auto out = indicators::compute(IndicatorKind::Ema, {1, 2, 3, 4}, 3);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_DOUBLE_EQ(out[2], 2.25);
    EXPECT_DOUBLE_EQ(out[3], 3.125);
    EXPECT_THROW(indicators::EmaIndicator(-1), std::invalid_argument);
}

TEST(RsiIndicatorTest, GainsAndLossesOverWindow) {
    auto out = indicators::compute(IndicatorKind::Rsi, {1, 2, 3, 2}, 3);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_DOUBLE_EQ(out[2], 100.0);               // No losses in the window
    EXPECT_NEAR(out[3], 100.0 - 100.0 / 3.0, 1e-9); // RS = 2
}

TEST(RsiIndicatorTest, FlatSeriesIsUndefined) {
    indicators::RsiIndicator rsi(3);
    EXPECT_EQ(rsi.getName(), "RSI(3)");
    rsi.calculate(std::vector<double>(6, 50.0));
    for (double v : rsi.getResult()) {
        EXPECT_TRUE(std::isnan(v));
    }
}

TEST(RsiIndicatorTest, StaysWithinBounds) {
    std::vector<double> closes;
    for (int i = 0; i < 60; ++i) {
        closes.push_back(100.0 + 10.0 * std::sin(i * 0.4) + 0.1 * i);
    }
    auto out = indicators::compute(IndicatorKind::Rsi, closes, 14);
    for (std::size_t i = 13; i < out.size(); ++i) {
        ASSERT_FALSE(std::isnan(out[i])) << "index " << i;
        EXPECT_GE(out[i], 0.0);
        EXPECT_LE(out[i], 100.0);
    }
}

TEST(PrevIndicatorTest, ShiftsBackward) {
    auto out = indicators::compute(IndicatorKind::Prev, {1, 2, 3}, 2);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_DOUBLE_EQ(out[2], 1.0);

    auto same = indicators::compute(IndicatorKind::Prev, {1, 2, 3}, 0);
    EXPECT_EQ(same, (std::vector<double>{1, 2, 3}));

    EXPECT_THROW(indicators::compute(IndicatorKind::Prev, {1, 2, 3}, -1), std::invalid_argument);
}
