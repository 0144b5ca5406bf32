#pragma once

#include "ast.hpp"
#include "parse_tree.hpp"
#include <string>
#include <vector>

namespace strategy_engine {

    // --- AstBuilder ---
    // Turns a parse tree into a validated AST. Every failure is a
    // core::ValidationError whose message names the offending value and lists
    // the valid alternatives.
    class AstBuilder {
    public:
        ast::Strategy build(const ParseNode& root) const;

        // Builds a single expression (an entry or exit body, or any sub-term).
        ast::NodePtr buildExpression(const ParseNode& node) const;

        // Sorted field names: close, high, low, open, volume
        static const std::vector<std::string>& validFieldNames();

    private:
        ast::NodePtr buildCombinator(const ParseNode& node) const;
        ast::NodePtr buildComparison(const ParseNode& node) const;
        ast::NodePtr buildArithmetic(const ParseNode& node) const;
        ast::NodePtr buildNumber(const ParseNode& node) const;
        ast::NodePtr buildField(const ParseNode& node) const;
        ast::NodePtr buildIndicator(const ParseNode& node) const;

        ast::NodePtr requireCondition(const ParseNode& node, const std::string& where) const;
        ast::NodePtr requireNumeric(const ParseNode& node, const std::string& where) const;
    };

    // Lex, parse and build in one step. Throws core::SyntaxError or
    // core::ValidationError.
    ast::Strategy compileStrategy(const std::string& dsl_text);

} // namespace strategy_engine
