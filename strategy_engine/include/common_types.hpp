#pragma once
#include "datatypes.hpp"     // Use short path (Provides core types)
#include <string>

namespace strategy_engine {

    // Enum to specify which candle field a Field node reads
    enum class PriceField {
        Open,
        High,
        Low,
        Close,
        Volume
    };

    // Enum for comparison types
    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE, // Greater Than or Equal To (>=)
        LTE, // Less Than or Equal To (<=)
        EQ,  // Equal To (==)
        CrossesAbove,
        CrossesBelow
    };

    enum class ArithmeticOp {
        Add,
        Subtract,
        Multiply,
        Divide
    };

    enum class BoolKind {
        And,
        Or
    };

    // --- Conversions (DSL spelling) ---
    std::string toString(PriceField field);
    std::string toString(ComparisonOp op);
    std::string toString(ArithmeticOp op);
    std::string toString(BoolKind kind);

} // namespace strategy_engine
