#include <gtest/gtest.h>

#include "json_to_dsl.hpp"
#include "ast_builder.hpp"
#include "exceptions.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using strategy_engine::JsonToDsl;

TEST(JsonToDslTest, RendersEntryAndExitSections) {
    json ir = {
        {"entry", {{{"left", "close"}, {"operator", ">"}, {"right", "sma(close, 20)"}}}},
        {"exit", {{{"left", "rsi(close, 14)"}, {"operator", "crosses_above"}, {"right", 70}}}}
    };
    EXPECT_EQ(JsonToDsl::convert(ir),
              "ENTRY:\n  close > SMA(close, 20)\n\nEXIT:\n  RSI(close, 14) CROSSES_ABOVE 70");
}

TEST(JsonToDslTest, JoinsWithConnectors) {
    json ir = {
        {"entry", {
            {{"left", "close"}, {"operator", ">"}, {"right", 100}, {"connector", "or"}},
            {{"left", "volume"}, {"operator", ">="}, {"right", 5000}, {"connector", "AND"}},
            {{"left", "Open"}, {"operator", "<"}, {"right", 1.5}, {"connector", "OR"}}
        }}
    };
    EXPECT_EQ(JsonToDsl::convert(ir),
              "ENTRY:\n  close > 100 OR volume >= 5000 AND open < 1.5\n\nEXIT:\n  FALSE");
}

TEST(JsonToDslTest, MissingConnectorDefaultsToAnd) {
    json ir = {
        {"entry", {
            {{"left", "close"}, {"operator", ">"}, {"right", 1}},
            {{"left", "close"}, {"operator", "<"}, {"right", 9}}
        }}
    };
    EXPECT_EQ(JsonToDsl::convert(ir), "ENTRY:\n  close > 1 AND close < 9\n\nEXIT:\n  FALSE");
}

TEST(JsonToDslTest, EmptySectionsBecomeLiterals) {
    EXPECT_EQ(JsonToDsl::convert(json::object()), "ENTRY:\n  TRUE\n\nEXIT:\n  FALSE");
    EXPECT_EQ(JsonToDsl::convert({{"entry", json::array()}, {"exit", nullptr}}),
              "ENTRY:\n  TRUE\n\nEXIT:\n  FALSE");
}

TEST(JsonToDslTest, FormatsTerms) {
    EXPECT_EQ(JsonToDsl::formatTerm(20), "20");
    EXPECT_EQ(JsonToDsl::formatTerm(0.5), "0.5");
    EXPECT_EQ(JsonToDsl::formatTerm("HIGH"), "high");
    EXPECT_EQ(JsonToDsl::formatTerm("ema(sma(close, 5), 10)"), "EMA(sma(close, 5), 10)");
    EXPECT_EQ(JsonToDsl::formatTerm("close * 1.02"), "close * 1.02");
    EXPECT_EQ(JsonToDsl::formatTerm("sma(close, 20) * 1.02"), "SMA(close, 20) * 1.02");
    EXPECT_EQ(JsonToDsl::formatTerm("rsi(close) - prev(close, 1)"), "RSI(close) - prev(close, 1)");
    EXPECT_THROW(JsonToDsl::formatTerm("sma(sma(close, 5), 10"), core::ValidationError);
    EXPECT_THROW(JsonToDsl::formatTerm(true), core::ValidationError);
}

TEST(JsonToDslTest, FormatsOperators) {
    EXPECT_EQ(JsonToDsl::formatOperator(">="), ">=");
    EXPECT_EQ(JsonToDsl::formatOperator(" == "), "==");
    EXPECT_EQ(JsonToDsl::formatOperator("Crosses_Below"), "CROSSES_BELOW");
    EXPECT_EQ(JsonToDsl::formatOperator("above"), "ABOVE");
}

TEST(JsonToDslTest, MalformedIrIsRejected) {
    EXPECT_THROW(JsonToDsl::convert(json::array()), core::ValidationError);
    EXPECT_THROW(JsonToDsl::convert({{"entry", "close > 1"}}), core::ValidationError);
    EXPECT_THROW(JsonToDsl::convert({{"entry", {{{"left", "close"}, {"right", 1}}}}}), core::ValidationError);
    EXPECT_THROW(JsonToDsl::convert({{"exit", {42}}}), core::ValidationError);
}

TEST(JsonToDslTest, OutputCompiles) {
    json ir = {
        {"entry", {{{"left", "ema(close, 12)"}, {"operator", "crosses_above"}, {"right", "ema(close, 26)"}}}},
        {"exit", {{{"left", "rsi(close)"}, {"operator", ">"}, {"right", 75}}}}
    };
    auto strategy = strategy_engine::compileStrategy(JsonToDsl::convert(ir));
    EXPECT_EQ(strategy_engine::ast::toDsl(*strategy.exit), "RSI(close, 14) > 75");
}
