#include "indicator_cache.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <variant>

namespace strategy_engine {

    namespace {
        template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
    }

    std::string canonicalArgument(const ast::Node& arg) {
        return std::visit(overloaded{
            [](const ast::Literal& lit) {
                return std::visit(overloaded{
                    [](bool b) { return std::string(b ? "true" : "false"); },
                    [](long long i) { return fmt::format("{}", i); },
                    [](double d) { return core::utils::formatNumber(d); }
                }, lit.value);
            },
            [](const ast::Field& field) { return field.name; },
            [](const ast::Indicator& ind) { return canonicalKey(ind); },
            [](const ast::Arithmetic& arith) {
                return fmt::format("({} {} {})", canonicalArgument(*arith.left), toString(arith.op),
                                   canonicalArgument(*arith.right));
            },
            [](const ast::Comparison& comp) {
                return fmt::format("({} {} {})", canonicalArgument(*comp.left), toString(comp.op),
                                   canonicalArgument(*comp.right));
            },
            [](const ast::BoolCombinator& comb) {
                std::string text;
                for (const auto& child : comb.children) {
                    if (!text.empty()) text += fmt::format(" {} ", toString(comb.kind));
                    text += canonicalArgument(*child);
                }
                return "(" + text + ")";
            }
        }, arg.value);
    }

    std::string canonicalKey(const ast::Indicator& call) {
        std::string key = call.name;
        for (const auto& arg : call.args) {
            key += "_";
            key += canonicalArgument(*arg);
        }
        return key;
    }

    void IndicatorCache::collect(const ast::NodePtr& node) {
        if (!node) {
            return;
        }
        std::visit(overloaded{
            [](const ast::Literal&) {},
            [](const ast::Field&) {},
            [this, &node](const ast::Indicator& ind) {
                const std::string key = canonicalKey(ind);
                if (entries_.emplace(key, node).second) {
                    core::logging::getLogger()->trace("IndicatorCache: collected '{}'", key);
                }
                for (const auto& arg : ind.args) {
                    collect(arg);
                }
            },
            [this](const ast::Arithmetic& arith) {
                collect(arith.left);
                collect(arith.right);
            },
            [this](const ast::Comparison& comp) {
                collect(comp.left);
                collect(comp.right);
            },
            [this](const ast::BoolCombinator& comb) {
                for (const auto& child : comb.children) {
                    collect(child);
                }
            }
        }, node->value);
    }

    std::vector<std::string> IndicatorCache::keys() const {
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            result.push_back(entry.first);
        }
        return result;
    }

    bool IndicatorCache::contains(const std::string& key) const {
        return entries_.count(key) > 0;
    }

} // namespace strategy_engine
