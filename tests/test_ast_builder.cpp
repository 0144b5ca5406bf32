#include <gtest/gtest.h>

#include "ast_builder.hpp"
#include "ast_json.hpp"
#include "exceptions.hpp"

#include <string>
#include <variant>

using namespace strategy_engine;

namespace {

    std::string validationMessage(const std::string& dsl) {
        try {
            compileStrategy(dsl);
        } catch (const core::ValidationError& e) {
            return e.what();
        }
        return "";
    }

} // namespace

TEST(AstBuilderTest, BuildsComparisonWithIndicator) {
    ast::Strategy s = compileStrategy("ENTRY: close > sma(close, 20) EXIT: close < 100");
    const auto* cmp = std::get_if<ast::Comparison>(&s.entry->value);
    ASSERT_NE(cmp, nullptr);
    EXPECT_EQ(cmp->op, ComparisonOp::GT);

    const auto* field = std::get_if<ast::Field>(&cmp->left->value);
    ASSERT_NE(field, nullptr);
    EXPECT_EQ(field->field, PriceField::Close);

    const auto* ind = std::get_if<ast::Indicator>(&cmp->right->value);
    ASSERT_NE(ind, nullptr);
    EXPECT_EQ(ind->kind, indicators::IndicatorKind::Sma);
    EXPECT_EQ(ind->name, "sma");
    ASSERT_EQ(ind->args.size(), 2u);
    const auto* period = std::get_if<ast::Literal>(&ind->args[1]->value);
    ASSERT_NE(period, nullptr);
    EXPECT_EQ(std::get<long long>(period->value), 20);
}

TEST(AstBuilderTest, SingleOperandCombinatorsCollapse) {
    ast::Strategy s = compileStrategy("ENTRY: close > 1 EXIT: FALSE");
    EXPECT_TRUE(std::holds_alternative<ast::Comparison>(s.entry->value));
    const auto* lit = std::get_if<ast::Literal>(&s.exit->value);
    ASSERT_NE(lit, nullptr);
    EXPECT_FALSE(std::get<bool>(lit->value));
}

TEST(AstBuilderTest, CombinatorsKeepAllOperands) {
    ast::Strategy s = compileStrategy(
        "ENTRY: close > 1 AND close > 2 AND volume > 3 OR open < 4 EXIT: FALSE");
    const auto* orNode = std::get_if<ast::BoolCombinator>(&s.entry->value);
    ASSERT_NE(orNode, nullptr);
    EXPECT_EQ(orNode->kind, BoolKind::Or);
    ASSERT_EQ(orNode->children.size(), 2u);
    const auto* andNode = std::get_if<ast::BoolCombinator>(&orNode->children[0]->value);
    ASSERT_NE(andNode, nullptr);
    EXPECT_EQ(andNode->kind, BoolKind::And);
    EXPECT_EQ(andNode->children.size(), 3u);
}

TEST(AstBuilderTest, LiteralsKeepIntegerOrDouble) {
    ast::Strategy s = compileStrategy("ENTRY: close > 2.5 AND close < 10.0 EXIT: FALSE");
    const auto& andNode = std::get<ast::BoolCombinator>(s.entry->value);
    const auto& first = std::get<ast::Comparison>(andNode.children[0]->value);
    const auto& second = std::get<ast::Comparison>(andNode.children[1]->value);
    EXPECT_DOUBLE_EQ(std::get<double>(std::get<ast::Literal>(first.right->value).value), 2.5);
    EXPECT_EQ(std::get<long long>(std::get<ast::Literal>(second.right->value).value), 10);
}

TEST(AstBuilderTest, FillsDefaultParameters) {
    ast::Strategy a = compileStrategy("ENTRY: rsi(close) < 30 EXIT: FALSE");
    ast::Strategy b = compileStrategy("ENTRY: rsi(close, 14) < 30 EXIT: FALSE");
    EXPECT_EQ(ast::toDsl(*a.entry), ast::toDsl(*b.entry));
    EXPECT_EQ(ast::toDsl(*a.entry), "RSI(close, 14) < 30");
}

TEST(AstBuilderTest, ArithmeticRendersParenthesized) {
    ast::Strategy s = compileStrategy("ENTRY: close > sma(close, 20) * 1.02 + 1 EXIT: FALSE");
    EXPECT_EQ(ast::toDsl(*s.entry), "close > ((SMA(close, 20) * 1.02) + 1)");
}

TEST(AstBuilderTest, UnknownFieldListsValidFields) {
    EXPECT_EQ(validationMessage("ENTRY: price > 5 EXIT: FALSE"),
              "Unknown field: 'price'. Valid fields: close, high, low, open, volume");
}

TEST(AstBuilderTest, UnknownIndicatorListsValidIndicators) {
    EXPECT_EQ(validationMessage("ENTRY: macd(close, 12) > 0 EXIT: FALSE"),
              "Unknown indicator: 'macd'. Valid indicators: ema, prev, rsi, sma");
}

TEST(AstBuilderTest, WrongArgumentCount) {
    EXPECT_EQ(validationMessage("ENTRY: sma(close) > 0 EXIT: FALSE"),
              "Wrong number of arguments for 'sma': got 1. Expected 2");
    EXPECT_EQ(validationMessage("ENTRY: rsi(close, 14, 2) > 0 EXIT: FALSE"),
              "Wrong number of arguments for 'rsi': got 3. Expected 1 to 2");
}

TEST(AstBuilderTest, PeriodMustBeNumericLiteral) {
    EXPECT_EQ(validationMessage("ENTRY: sma(close, volume) > 0 EXIT: FALSE"),
              "Argument 2 of 'sma' must be a numeric literal, got 'volume'");
}

TEST(AstBuilderTest, BareTermAsConditionIsSyntaxError) {
    try {
        compileStrategy("ENTRY: close EXIT: FALSE");
        FAIL() << "Expected SyntaxError";
    } catch (const core::SyntaxError& e) {
        EXPECT_EQ(e.token(), "close");
        EXPECT_EQ(e.line(), 1);
        EXPECT_EQ(e.column(), 8);
    }
    EXPECT_THROW(compileStrategy("ENTRY: close > 1 EXIT: sma(close, 5)"), core::SyntaxError);
    EXPECT_THROW(compileStrategy("ENTRY: close > 1 AND 5 EXIT: FALSE"), core::SyntaxError);
    EXPECT_THROW(compileStrategy("ENTRY: close > 1 OR close * 2 EXIT: FALSE"), core::SyntaxError);
}

TEST(AstBuilderTest, ConditionAsOperandIsValidationError) {
    EXPECT_THROW(compileStrategy("ENTRY: (close > 1) > 2 EXIT: FALSE"), core::ValidationError);
}

TEST(AstBuilderTest, NestedIndicatorArguments) {
    ast::Strategy s = compileStrategy("ENTRY: ema(sma(close, 5), 10) > prev(close) EXIT: FALSE");
    EXPECT_EQ(ast::toDsl(*s.entry), "EMA(SMA(close, 5), 10) > PREV(close, 1)");
}

TEST(AstJsonTest, DumpsTree) {
    ast::Strategy s = compileStrategy("ENTRY: close CROSSES_ABOVE sma(close, 20) EXIT: TRUE");
    nlohmann::json j = toJson(s);
    EXPECT_EQ(j["type"], "strategy");
    EXPECT_EQ(j["entry"]["type"], "comparison");
    EXPECT_EQ(j["entry"]["operator"], "CROSSES_ABOVE");
    EXPECT_EQ(j["entry"]["left"]["type"], "field");
    EXPECT_EQ(j["entry"]["right"]["name"], "sma");
    EXPECT_EQ(j["entry"]["right"]["args"][1]["value"], 20);
    EXPECT_EQ(j["exit"]["value"], true);
}
