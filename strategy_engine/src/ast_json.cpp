#include "ast_json.hpp"
#include <variant>

namespace strategy_engine {

    using json = nlohmann::json; // Alias

    namespace {
        template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
    }

    json toJson(const ast::Node& node) {
        return std::visit(overloaded{
            [](const ast::Literal& lit) {
                json j = {{"type", "literal"}};
                std::visit([&j](auto v) { j["value"] = v; }, lit.value);
                return j;
            },
            [](const ast::Field& field) {
                return json{{"type", "field"}, {"name", field.name}};
            },
            [](const ast::Indicator& ind) {
                json args = json::array();
                for (const auto& arg : ind.args) {
                    args.push_back(toJson(*arg));
                }
                return json{{"type", "indicator"}, {"name", ind.name}, {"args", args}};
            },
            [](const ast::Arithmetic& arith) {
                return json{{"type", "arithmetic"},
                            {"operator", toString(arith.op)},
                            {"left", toJson(*arith.left)},
                            {"right", toJson(*arith.right)}};
            },
            [](const ast::Comparison& comp) {
                return json{{"type", "comparison"},
                            {"operator", toString(comp.op)},
                            {"left", toJson(*comp.left)},
                            {"right", toJson(*comp.right)}};
            },
            [&node](const ast::BoolCombinator& comb) {
                json children = json::array();
                for (const auto& child : comb.children) {
                    children.push_back(toJson(*child));
                }
                return json{{"type", ast::kindName(node)}, {"children", children}};
            }
        }, node.value);
    }

    json toJson(const ast::Strategy& strategy) {
        return json{{"type", "strategy"},
                    {"entry", toJson(*strategy.entry)},
                    {"exit", toJson(*strategy.exit)}};
    }

} // namespace strategy_engine
