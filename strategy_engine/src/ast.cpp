#include "ast.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <utility>

namespace strategy_engine {

    // --- common_types conversions ---

    std::string toString(PriceField field) {
        switch (field) {
            case PriceField::Open: return "open";
            case PriceField::High: return "high";
            case PriceField::Low: return "low";
            case PriceField::Close: return "close";
            case PriceField::Volume: return "volume";
        }
        throw std::logic_error("Unhandled PriceField");
    }

    std::string toString(ComparisonOp op) {
        switch (op) {
            case ComparisonOp::GT: return ">";
            case ComparisonOp::LT: return "<";
            case ComparisonOp::GTE: return ">=";
            case ComparisonOp::LTE: return "<=";
            case ComparisonOp::EQ: return "==";
            case ComparisonOp::CrossesAbove: return "CROSSES_ABOVE";
            case ComparisonOp::CrossesBelow: return "CROSSES_BELOW";
        }
        throw std::logic_error("Unhandled ComparisonOp");
    }

    std::string toString(ArithmeticOp op) {
        switch (op) {
            case ArithmeticOp::Add: return "+";
            case ArithmeticOp::Subtract: return "-";
            case ArithmeticOp::Multiply: return "*";
            case ArithmeticOp::Divide: return "/";
        }
        throw std::logic_error("Unhandled ArithmeticOp");
    }

    std::string toString(BoolKind kind) {
        return kind == BoolKind::And ? "AND" : "OR";
    }

namespace ast {

    namespace {
        // Helper for std::visit with lambdas
        template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

        std::string literalToDsl(const LiteralValue& value) {
            return std::visit(overloaded{
                [](bool b) { return std::string(b ? "TRUE" : "FALSE"); },
                [](long long i) { return fmt::format("{}", i); },
                [](double d) { return core::utils::formatNumber(d); }
            }, value);
        }
    } // end anonymous namespace

    NodePtr makeLiteral(LiteralValue value) {
        return std::make_shared<const Node>(Node{Literal{std::move(value)}});
    }

    NodePtr makeField(PriceField field) {
        return std::make_shared<const Node>(Node{Field{field, toString(field)}});
    }

    NodePtr makeIndicator(indicators::IndicatorKind kind, std::vector<NodePtr> args) {
        return std::make_shared<const Node>(Node{Indicator{kind, indicators::indicatorName(kind), std::move(args)}});
    }

    NodePtr makeArithmetic(ArithmeticOp op, NodePtr left, NodePtr right) {
        return std::make_shared<const Node>(Node{Arithmetic{op, std::move(left), std::move(right)}});
    }

    NodePtr makeComparison(ComparisonOp op, NodePtr left, NodePtr right) {
        return std::make_shared<const Node>(Node{Comparison{op, std::move(left), std::move(right)}});
    }

    NodePtr makeBoolCombinator(BoolKind kind, std::vector<NodePtr> children) {
        return std::make_shared<const Node>(Node{BoolCombinator{kind, std::move(children)}});
    }

    bool isBoolean(const Node& node) {
        return std::visit(overloaded{
            [](const Literal& lit) { return std::holds_alternative<bool>(lit.value); },
            [](const Field&) { return false; },
            [](const Indicator&) { return false; },
            [](const Arithmetic&) { return false; },
            [](const Comparison&) { return true; },
            [](const BoolCombinator&) { return true; }
        }, node.value);
    }

    std::string kindName(const Node& node) {
        return std::visit(overloaded{
            [](const Literal&) { return std::string("literal"); },
            [](const Field&) { return std::string("field"); },
            [](const Indicator&) { return std::string("indicator"); },
            [](const Arithmetic&) { return std::string("arithmetic"); },
            [](const Comparison&) { return std::string("comparison"); },
            [](const BoolCombinator& comb) { return std::string(comb.kind == BoolKind::And ? "and" : "or"); }
        }, node.value);
    }

    std::string toDsl(const Node& node) {
        return std::visit(overloaded{
            [](const Literal& lit) { return literalToDsl(lit.value); },
            [](const Field& field) { return field.name; },
            [](const Indicator& ind) {
                std::string args;
                for (const auto& arg : ind.args) {
                    if (!args.empty()) args += ", ";
                    args += toDsl(*arg);
                }
                return fmt::format("{}({})", core::utils::toUpper(ind.name), args);
            },
            [](const Arithmetic& arith) {
                return fmt::format("({} {} {})", toDsl(*arith.left), toString(arith.op), toDsl(*arith.right));
            },
            [](const Comparison& comp) {
                return fmt::format("{} {} {}", toDsl(*comp.left), toString(comp.op), toDsl(*comp.right));
            },
            [](const BoolCombinator& comb) {
                std::string text;
                for (const auto& child : comb.children) {
                    if (!text.empty()) text += fmt::format(" {} ", toString(comb.kind));
                    text += toDsl(*child);
                }
                return "(" + text + ")";
            }
        }, node.value);
    }

    std::string toDsl(const Strategy& strategy) {
        return fmt::format("ENTRY:\n  {}\n\nEXIT:\n  {}\n", toDsl(*strategy.entry), toDsl(*strategy.exit));
    }

} // namespace ast
} // namespace strategy_engine
