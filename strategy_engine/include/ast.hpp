#pragma once

#include "common_types.hpp"
#include "indicators.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace strategy_engine {
namespace ast {

    struct Node;
    // Nodes are immutable once built and may be shared between trees.
    using NodePtr = std::shared_ptr<const Node>;

    // Whole-number literals are integers so they can serve as lookback periods.
    using LiteralValue = std::variant<bool, long long, double>;

    struct Literal {
        LiteralValue value;
    };

    struct Field {
        PriceField field;
        std::string name;
    };

    struct Indicator {
        indicators::IndicatorKind kind;
        std::string name;
        std::vector<NodePtr> args;   // Optional trailing parameters filled with registry defaults
    };

    struct Arithmetic {
        ArithmeticOp op;
        NodePtr left;
        NodePtr right;
    };

    struct Comparison {
        ComparisonOp op;
        NodePtr left;
        NodePtr right;
    };

    struct BoolCombinator {
        BoolKind kind;
        std::vector<NodePtr> children;   // Always two or more
    };

    struct Node {
        std::variant<Literal, Field, Indicator, Arithmetic, Comparison, BoolCombinator> value;
    };

    struct Strategy {
        NodePtr entry;
        NodePtr exit;
    };

    // --- Factories ---
    NodePtr makeLiteral(LiteralValue value);
    NodePtr makeField(PriceField field);
    NodePtr makeIndicator(indicators::IndicatorKind kind, std::vector<NodePtr> args);
    NodePtr makeArithmetic(ArithmeticOp op, NodePtr left, NodePtr right);
    NodePtr makeComparison(ComparisonOp op, NodePtr left, NodePtr right);
    NodePtr makeBoolCombinator(BoolKind kind, std::vector<NodePtr> children);

    // --- Queries ---
    // Comparisons, combinators and boolean literals yield conditions;
    // everything else yields numbers.
    bool isBoolean(const Node& node);

    // Kind name as used in JSON dumps: "literal", "field", "indicator", ...
    std::string kindName(const Node& node);

    // Renders the node back as DSL text (fully parenthesized arithmetic).
    std::string toDsl(const Node& node);
    std::string toDsl(const Strategy& strategy);

} // namespace ast
} // namespace strategy_engine
