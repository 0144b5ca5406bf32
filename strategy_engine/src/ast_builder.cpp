#include "ast_builder.hpp"
#include "parser.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <map>
#include <stdexcept>
#include <utility>

namespace strategy_engine {

    namespace { // File-local helpers

        // Whole numbers up to 2^53 are exact in a double and become integers.
        constexpr double kMaxExactInteger = 9007199254740992.0;

        std::string joinNames(const std::vector<std::string>& names) {
            std::string joined;
            for (const auto& name : names) {
                if (!joined.empty()) joined += ", ";
                joined += name;
            }
            return joined;
        }

        const std::map<std::string, PriceField>& fieldTable() {
            static const std::map<std::string, PriceField> table = {
                {"close", PriceField::Close},
                {"high", PriceField::High},
                {"low", PriceField::Low},
                {"open", PriceField::Open},
                {"volume", PriceField::Volume},
            };
            return table;
        }

        // First source token of a subtree, for error positions.
        const Token& leadingToken(const ParseNode& node) {
            if ((node.production == Production::Arithmetic || node.production == Production::Comparison) &&
                !node.children.empty()) {
                return leadingToken(node.children.front());
            }
            return node.token;
        }

        ComparisonOp comparisonFromToken(const Token& tok) {
            switch (tok.type) {
                case TokenType::Greater: return ComparisonOp::GT;
                case TokenType::Less: return ComparisonOp::LT;
                case TokenType::GreaterEqual: return ComparisonOp::GTE;
                case TokenType::LessEqual: return ComparisonOp::LTE;
                case TokenType::EqualEqual: return ComparisonOp::EQ;
                case TokenType::CrossesAbove: return ComparisonOp::CrossesAbove;
                case TokenType::CrossesBelow: return ComparisonOp::CrossesBelow;
                default:
                    throw core::ValidationError(fmt::format(
                        "Unknown operator: '{}'. Valid operators: <, <=, ==, >, >=, CROSSES_ABOVE, CROSSES_BELOW",
                        tok.text));
            }
        }

        ArithmeticOp arithmeticFromToken(const Token& tok) {
            switch (tok.type) {
                case TokenType::Plus: return ArithmeticOp::Add;
                case TokenType::Minus: return ArithmeticOp::Subtract;
                case TokenType::Star: return ArithmeticOp::Multiply;
                case TokenType::Slash: return ArithmeticOp::Divide;
                default:
                    throw core::ValidationError(fmt::format(
                        "Unknown arithmetic operator: '{}'. Valid operators: *, +, -, /", tok.text));
            }
        }

        std::string arityText(const indicators::IndicatorSignature& sig) {
            if (sig.required_args == sig.max_args) {
                return fmt::format("{}", sig.required_args);
            }
            return fmt::format("{} to {}", sig.required_args, sig.max_args);
        }

    } // end anonymous namespace

    const std::vector<std::string>& AstBuilder::validFieldNames() {
        static const std::vector<std::string> names = [] {
            std::vector<std::string> sorted;
            for (const auto& entry : fieldTable()) {
                sorted.push_back(entry.first);
            }
            return sorted;
        }();
        return names;
    }

    ast::Strategy AstBuilder::build(const ParseNode& root) const {
        auto logger = core::logging::getLogger();
        if (root.production != Production::Strategy || root.children.size() != 2) {
            throw core::ValidationError(fmt::format(
                "Expected a strategy with ENTRY and EXIT sections, got '{}'", productionName(root.production)));
        }

        ast::Strategy strategy;
        strategy.entry = requireCondition(root.children[0].children.at(0), "ENTRY section");
        strategy.exit = requireCondition(root.children[1].children.at(0), "EXIT section");
        logger->debug("Built strategy AST. Entry: {} | Exit: {}", ast::toDsl(*strategy.entry), ast::toDsl(*strategy.exit));
        return strategy;
    }

    ast::NodePtr AstBuilder::buildExpression(const ParseNode& node) const {
        switch (node.production) {
            case Production::OrExpr:
            case Production::AndExpr:
                return buildCombinator(node);
            case Production::Comparison:
                return buildComparison(node);
            case Production::Arithmetic:
                return buildArithmetic(node);
            case Production::Number:
                return buildNumber(node);
            case Production::Call:
                return buildIndicator(node);
            case Production::Identifier:
                return buildField(node);
            case Production::BoolLiteral:
                return ast::makeLiteral(node.token.type == TokenType::True);
            case Production::Group:
                return buildExpression(node.children.at(0));
            case Production::Strategy:
            case Production::Section:
                break;
        }
        throw core::ValidationError(fmt::format(
            "Unexpected '{}' inside an expression", productionName(node.production)));
    }

    ast::NodePtr AstBuilder::buildCombinator(const ParseNode& node) const {
        // A single operand is not wrapped
        if (node.children.size() == 1) {
            return buildExpression(node.children.front());
        }
        const BoolKind kind = node.production == Production::OrExpr ? BoolKind::Or : BoolKind::And;
        std::vector<ast::NodePtr> children;
        children.reserve(node.children.size());
        for (const auto& child : node.children) {
            children.push_back(requireCondition(child, fmt::format("{} operand", toString(kind))));
        }
        return ast::makeBoolCombinator(kind, std::move(children));
    }

    ast::NodePtr AstBuilder::buildComparison(const ParseNode& node) const {
        const ComparisonOp op = comparisonFromToken(node.token);
        const std::string where = fmt::format("operand of '{}'", toString(op));
        auto left = requireNumeric(node.children.at(0), where);
        auto right = requireNumeric(node.children.at(1), where);
        return ast::makeComparison(op, std::move(left), std::move(right));
    }

    ast::NodePtr AstBuilder::buildArithmetic(const ParseNode& node) const {
        const ArithmeticOp op = arithmeticFromToken(node.token);
        const std::string where = fmt::format("operand of '{}'", toString(op));
        auto left = requireNumeric(node.children.at(0), where);
        auto right = requireNumeric(node.children.at(1), where);
        return ast::makeArithmetic(op, std::move(left), std::move(right));
    }

    ast::NodePtr AstBuilder::buildNumber(const ParseNode& node) const {
        double value = 0.0;
        try {
            value = std::stod(node.token.text);
        } catch (const std::out_of_range&) {
            throw core::ValidationError(fmt::format("Numeric literal out of range: '{}'", node.token.text));
        } catch (const std::invalid_argument&) {
            throw core::ValidationError(fmt::format("Invalid numeric literal: '{}'", node.token.text));
        }
        if (std::floor(value) == value && std::fabs(value) <= kMaxExactInteger) {
            return ast::makeLiteral(static_cast<long long>(value));
        }
        return ast::makeLiteral(value);
    }

    ast::NodePtr AstBuilder::buildField(const ParseNode& node) const {
        auto it = fieldTable().find(node.token.text);
        if (it == fieldTable().end()) {
            throw core::ValidationError(fmt::format(
                "Unknown field: '{}'. Valid fields: {}", node.token.text, joinNames(validFieldNames())));
        }
        return ast::makeField(it->second);
    }

    ast::NodePtr AstBuilder::buildIndicator(const ParseNode& node) const {
        const std::string& name = node.token.text;
        auto kind = indicators::indicatorFromName(name);
        if (!kind) {
            throw core::ValidationError(fmt::format(
                "Unknown indicator: '{}'. Valid indicators: {}", name, joinNames(indicators::validIndicatorNames())));
        }

        const indicators::IndicatorSignature sig = indicators::signatureOf(*kind);
        const std::size_t given = node.children.size();
        if (given < sig.required_args || given > sig.max_args) {
            throw core::ValidationError(fmt::format(
                "Wrong number of arguments for '{}': got {}. Expected {}", name, given, arityText(sig)));
        }

        std::vector<ast::NodePtr> args;
        args.reserve(sig.max_args);
        args.push_back(requireNumeric(node.children[0], fmt::format("series argument of '{}'", name)));
        for (std::size_t i = 1; i < given; ++i) {
            auto arg = buildExpression(node.children[i]);
            const auto* lit = std::get_if<ast::Literal>(&arg->value);
            if (lit == nullptr || std::holds_alternative<bool>(lit->value)) {
                throw core::ValidationError(fmt::format(
                    "Argument {} of '{}' must be a numeric literal, got '{}'", i + 1, name, ast::toDsl(*arg)));
            }
            args.push_back(std::move(arg));
        }
        // Fill optional trailing parameters so rsi(close) and rsi(close, 14) are the same call
        if (args.size() < sig.max_args && sig.default_parameter) {
            const double def = *sig.default_parameter;
            args.push_back(ast::makeLiteral(static_cast<long long>(def)));
        }
        return ast::makeIndicator(*kind, std::move(args));
    }

    ast::NodePtr AstBuilder::requireCondition(const ParseNode& node, const std::string& where) const {
        auto built = buildExpression(node);
        if (!ast::isBoolean(*built)) {
            // A bare term where the grammar wants a comparison
            const Token& tok = leadingToken(node);
            throw core::SyntaxError(
                fmt::format("Syntax error at line {}, column {}: expected a condition for {} but found {} '{}'",
                            tok.line, tok.column, where, ast::kindName(*built), ast::toDsl(*built)),
                tok.text, tok.line, tok.column);
        }
        return built;
    }

    ast::NodePtr AstBuilder::requireNumeric(const ParseNode& node, const std::string& where) const {
        auto built = buildExpression(node);
        if (ast::isBoolean(*built)) {
            throw core::ValidationError(fmt::format(
                "Expected a numeric value for {} but found {} '{}'. Valid values: field, indicator call, number, arithmetic expression",
                where, ast::kindName(*built), ast::toDsl(*built)));
        }
        return built;
    }

    ast::Strategy compileStrategy(const std::string& dsl_text) {
        AstBuilder builder;
        return builder.build(Parser::parse(dsl_text));
    }

} // namespace strategy_engine
