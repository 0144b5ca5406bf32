#include <gtest/gtest.h>

#include "expression_evaluator.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

using namespace strategy_engine;
using test_helpers::makePrices;

namespace {

    core::SignalSeries entryOf(const std::string& dsl, const core::PriceTable& prices) {
        return compileDsl(dsl).evaluate(prices).entry;
    }

    core::SignalSeries bools(std::initializer_list<int> values) {
        core::SignalSeries out;
        for (int v : values) out.push_back(v != 0);
        return out;
    }

} // namespace

TEST(ExpressionEvaluatorTest, ComparisonsPerBar) {
    auto prices = makePrices({1, 3, 2, 5});
    EXPECT_EQ(entryOf("ENTRY: close > 2 EXIT: FALSE", prices), bools({0, 1, 0, 1}));
    EXPECT_EQ(entryOf("ENTRY: close >= 2 EXIT: FALSE", prices), bools({0, 1, 1, 1}));
    EXPECT_EQ(entryOf("ENTRY: close == 2 EXIT: FALSE", prices), bools({0, 0, 1, 0}));
    EXPECT_EQ(entryOf("ENTRY: close <= 2 EXIT: FALSE", prices), bools({1, 0, 1, 0}));
    EXPECT_EQ(entryOf("ENTRY: close < 2 EXIT: FALSE", prices), bools({1, 0, 0, 0}));
}

TEST(ExpressionEvaluatorTest, CrossesAboveNeedsPriorBar) {
    auto prices = makePrices({1, 3, 2, 5});
    EXPECT_EQ(entryOf("ENTRY: close CROSSES_ABOVE 2 EXIT: FALSE", prices), bools({0, 1, 0, 1}));
}

TEST(ExpressionEvaluatorTest, CrossesBelow) {
    auto prices = makePrices({3, 1, 2, 1});
    EXPECT_EQ(entryOf("ENTRY: close CROSSES_BELOW 2 EXIT: FALSE", prices), bools({0, 1, 0, 1}));
}

TEST(ExpressionEvaluatorTest, BooleanCombinators) {
    auto prices = makePrices({1, 2, 3, 4});
    EXPECT_EQ(entryOf("ENTRY: close > 1 AND close < 4 EXIT: FALSE", prices), bools({0, 1, 1, 0}));
    EXPECT_EQ(entryOf("ENTRY: close < 2 OR close > 3 EXIT: FALSE", prices), bools({1, 0, 0, 1}));
    EXPECT_EQ(entryOf("ENTRY: (close < 2 OR close > 3) AND close > 1 EXIT: FALSE", prices), bools({0, 0, 0, 1}));
}

TEST(ExpressionEvaluatorTest, LiteralSections) {
    auto prices = makePrices({1, 2, 3});
    SignalPair signals = compileDsl("ENTRY: TRUE EXIT: FALSE").evaluate(prices);
    EXPECT_EQ(signals.entry, bools({1, 1, 1}));
    EXPECT_EQ(signals.exit, bools({0, 0, 0}));
}

TEST(ExpressionEvaluatorTest, ArithmeticOnColumns) {
    auto prices = makePrices({1, 2, 3, 4});
    EXPECT_EQ(entryOf("ENTRY: close * 2 - 1 > 4 EXIT: FALSE", prices), bools({0, 0, 1, 1}));
    EXPECT_EQ(entryOf("ENTRY: close / 0 > 1 EXIT: FALSE", prices), bools({1, 1, 1, 1}));  // +inf
    EXPECT_EQ(entryOf("ENTRY: volume > 1001 EXIT: FALSE", prices), bools({0, 0, 1, 1}));
}

TEST(ExpressionEvaluatorTest, WarmUpBarsAreFalse) {
    auto prices = test_helpers::makeWavePrices(15);
    SignalPair signals = compileDsl("ENTRY: close > sma(close, 20) EXIT: close < sma(close, 20)").evaluate(prices);
    ASSERT_EQ(signals.entry.size(), 15u);
    EXPECT_EQ(signals.entry, core::SignalSeries(15, false));
    EXPECT_EQ(signals.exit, core::SignalSeries(15, false));
}

TEST(ExpressionEvaluatorTest, IndicatorAgainstPrice) {
    // SMA(2) of 1,1,4,0 is NaN,1,2.5,2
    auto prices = makePrices({1, 1, 4, 0});
    EXPECT_EQ(entryOf("ENTRY: close > sma(close, 2) EXIT: FALSE", prices), bools({0, 0, 1, 0}));
    EXPECT_EQ(entryOf("ENTRY: close CROSSES_BELOW sma(close, 2) EXIT: FALSE", prices), bools({0, 0, 0, 1}));
    EXPECT_EQ(entryOf("ENTRY: close > prev(close) EXIT: FALSE", prices), bools({0, 0, 1, 0}));
}

TEST(ExpressionEvaluatorTest, EvaluationIsDeterministic) {
    auto prices = test_helpers::makeWavePrices(80);
    CompiledStrategy strategy = compileDsl(
        "ENTRY: ema(close, 5) CROSSES_ABOVE sma(close, 12) AND rsi(close) < 70\n"
        "EXIT: ema(close, 5) CROSSES_BELOW sma(close, 12)");
    SignalPair first = strategy.evaluate(prices);
    SignalPair second = strategy.evaluate(prices);
    EXPECT_EQ(first.entry, second.entry);
    EXPECT_EQ(first.exit, second.exit);
}

TEST(ExpressionEvaluatorTest, EachIndicatorComputedOncePerRun) {
    auto prices = test_helpers::makeWavePrices(40);
    CompiledStrategy strategy = compileDsl(
        "ENTRY: close > sma(close, 10) AND sma(close, 10) > 100\n"
        "EXIT: close < sma(close, 10) OR rsi(close) > rsi(close, 14)");

    EvaluationTrace trace;
    strategy.evaluate(prices, &trace);
    EXPECT_EQ(trace.materialization_order, (std::vector<std::string>{"rsi_close_14", "sma_close_10"}));
    EXPECT_EQ(trace.computation_counts.at("sma_close_10"), 1);
    EXPECT_EQ(trace.computation_counts.at("rsi_close_14"), 1);

    // A second run starts from an empty context
    EvaluationTrace again;
    strategy.evaluate(prices, &again);
    EXPECT_EQ(again.computation_counts.at("sma_close_10"), 1);
}

TEST(ExpressionEvaluatorTest, NestedIndicatorMaterializedBeforeParent) {
    auto prices = test_helpers::makeWavePrices(40);
    CompiledStrategy strategy = compileDsl("ENTRY: ema(sma(close, 5), 10) > 0 EXIT: sma(close, 5) < 0");
    EXPECT_EQ(strategy.indicatorKeys(), (std::vector<std::string>{"ema_sma_close_5_10", "sma_close_5"}));

    EvaluationTrace trace;
    SignalPair signals = strategy.evaluate(prices, &trace);
    EXPECT_EQ(trace.materialization_order, (std::vector<std::string>{"sma_close_5", "ema_sma_close_5_10"}));
    EXPECT_EQ(trace.computation_counts.at("sma_close_5"), 1);
    // ema needs 10 defined inputs, the first of which is bar 4
    EXPECT_FALSE(signals.entry[12]);
    EXPECT_TRUE(signals.entry[13]);
}

TEST(ExpressionEvaluatorTest, FractionalPeriodTruncates) {
    auto prices = makePrices({1, 2, 3, 4});
    auto fractional = compileDsl("ENTRY: sma(close, 2.5) > 2 EXIT: FALSE").evaluate(prices);
    auto whole = compileDsl("ENTRY: sma(close, 2) > 2 EXIT: FALSE").evaluate(prices);
    EXPECT_EQ(fractional.entry, whole.entry);
}

TEST(ExpressionEvaluatorTest, BadPeriodRaisesRuntimeError) {
    auto prices = makePrices({1, 2, 3, 4});
    CompiledStrategy strategy = compileDsl("ENTRY: sma(close, -3) > 0 EXIT: FALSE");
    try {
        strategy.evaluate(prices);
        FAIL() << "Expected RuntimeError";
    } catch (const core::RuntimeError& e) {
        EXPECT_EQ(e.indicatorName(), "sma");
        EXPECT_NE(std::string(e.what()).find("sma_close_-3"), std::string::npos);
    }
    EXPECT_THROW(compileDsl("ENTRY: ema(close, 0.5) > 0 EXIT: FALSE").evaluate(prices), core::RuntimeError);
}

TEST(ExpressionEvaluatorTest, RejectsUnorderedIndex) {
    auto prices = makePrices({1, 2, 3});
    std::swap(prices[1].timestamp, prices[2].timestamp);
    EXPECT_THROW(compileDsl("ENTRY: close > 1 EXIT: FALSE").evaluate(prices), core::ValidationError);

    auto duplicated = makePrices({1, 2});
    duplicated[1].timestamp = duplicated[0].timestamp;
    EXPECT_THROW(compileDsl("ENTRY: close > 1 EXIT: FALSE").evaluate(duplicated), core::ValidationError);
}

TEST(ExpressionEvaluatorTest, EmptyPriceTable) {
    SignalPair signals = compileDsl("ENTRY: close > sma(close, 3) EXIT: rsi(close) > 70").evaluate(core::PriceTable{});
    EXPECT_TRUE(signals.entry.empty());
    EXPECT_TRUE(signals.exit.empty());
}
