#pragma once

#include "lexer.hpp"
#include <string>
#include <vector>

namespace strategy_engine {

    // One node per grammar production. The parse tree keeps every layer the
    // grammar has (OR and AND nodes exist even with a single operand); the
    // AST builder decides what survives.
    enum class Production {
        Strategy,       // children: entry section, exit section
        Section,        // token: ENTRY/EXIT, children: expression
        OrExpr,         // children: one or more AndExpr
        AndExpr,        // children: one or more comparison-level nodes
        Comparison,     // token: operator, children: left, right
        Arithmetic,     // token: + - * /, children: left, right
        Number,         // token: literal text, sign folded in
        Call,           // token: indicator name, children: arguments
        Identifier,     // token: field name
        BoolLiteral,    // token: TRUE/FALSE
        Group           // parenthesized expression, children: inner expression
    };

    struct ParseNode {
        Production production = Production::Strategy;
        Token token;
        std::vector<ParseNode> children;
    };

    std::string productionName(Production production);

} // namespace strategy_engine
