#pragma once

#include "ast.hpp"
#include <nlohmann/json.hpp>

namespace strategy_engine {

    // AST dump, e.g. {"type": "comparison", "operator": ">", "left": {...}, "right": {...}}
    nlohmann::json toJson(const ast::Node& node);

    // {"type": "strategy", "entry": {...}, "exit": {...}}
    nlohmann::json toJson(const ast::Strategy& strategy);

} // namespace strategy_engine
