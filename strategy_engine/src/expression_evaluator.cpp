#include "expression_evaluator.hpp"
#include "ast_builder.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <utility>
#include <variant>

namespace strategy_engine {

    namespace {

        template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

        using Column = core::TimeSeries<double>;

        void validatePriceIndex(const core::PriceTable& prices) {
            for (std::size_t i = 1; i < prices.size(); ++i) {
                if (!(prices[i - 1].timestamp < prices[i].timestamp)) {
                    throw core::ValidationError(fmt::format(
                        "Price table index must be strictly increasing: row {} ({}) does not follow row {} ({})",
                        i, core::utils::timestampToString(prices[i].timestamp),
                        i - 1, core::utils::timestampToString(prices[i - 1].timestamp)));
                }
            }
        }

        bool compareAt(ComparisonOp op, double l, double r) {
            switch (op) {
                case ComparisonOp::GT: return l > r;
                case ComparisonOp::LT: return l < r;
                case ComparisonOp::GTE: return l >= r;
                case ComparisonOp::LTE: return l <= r;
                case ComparisonOp::EQ: return l == r;
                case ComparisonOp::CrossesAbove:
                case ComparisonOp::CrossesBelow:
                    break;
            }
            throw std::logic_error("compareAt called with a crossing operator");
        }

        double applyArithmetic(ArithmeticOp op, double l, double r) {
            switch (op) {
                case ArithmeticOp::Add: return l + r;
                case ArithmeticOp::Subtract: return l - r;
                case ArithmeticOp::Multiply: return l * r;
                case ArithmeticOp::Divide: return l / r;
            }
            throw std::logic_error("Unhandled ArithmeticOp");
        }

        // --- EvaluationContext ---
        // Per-run state: materialized indicator columns, field columns and the trace.
        class EvaluationContext {
        public:
            EvaluationContext(const core::PriceTable& prices, const IndicatorCache& cache, EvaluationTrace* trace)
                : prices_(prices), cache_(cache), trace_(trace) {}

            void materializeAll() {
                for (const auto& entry : cache_.entries()) {
                    const auto* ind = std::get_if<ast::Indicator>(&entry.second->value);
                    if (ind == nullptr) {
                        throw core::RuntimeError(fmt::format("Cache entry '{}' is not an indicator call", entry.first));
                    }
                    materialize(entry.first, *ind);
                }
            }

            Column numeric(const ast::Node& node) {
                return std::visit(overloaded{
                    [this](const ast::Literal& lit) {
                        const double value = std::visit(overloaded{
                            [](bool b) { return b ? 1.0 : 0.0; },
                            [](long long i) { return static_cast<double>(i); },
                            [](double d) { return d; }
                        }, lit.value);
                        return Column(prices_.size(), value);
                    },
                    [this](const ast::Field& field) { return fieldColumn(field.field); },
                    [this](const ast::Indicator& ind) { return materialize(canonicalKey(ind), ind); },
                    [this](const ast::Arithmetic& arith) {
                        Column left = numeric(*arith.left);
                        const Column right = numeric(*arith.right);
                        for (std::size_t i = 0; i < left.size(); ++i) {
                            left[i] = applyArithmetic(arith.op, left[i], right[i]);
                        }
                        return left;
                    },
                    [](const ast::Comparison& comp) -> Column {
                        throw core::RuntimeError(fmt::format(
                            "Condition '{}' used where a number is required", toString(comp.op)));
                    },
                    [](const ast::BoolCombinator& comb) -> Column {
                        throw core::RuntimeError(fmt::format(
                            "{} combination used where a number is required", toString(comb.kind)));
                    }
                }, node.value);
            }

            core::SignalSeries condition(const ast::Node& node) {
                const std::size_t n = prices_.size();
                return std::visit(overloaded{
                    [n](const ast::Literal& lit) {
                        const bool* b = std::get_if<bool>(&lit.value);
                        if (b == nullptr) {
                            throw core::RuntimeError("Numeric literal used where a condition is required");
                        }
                        return core::SignalSeries(n, *b);
                    },
                    [this, n](const ast::Comparison& comp) {
                        const Column left = numeric(*comp.left);
                        const Column right = numeric(*comp.right);
                        core::SignalSeries result(n, false);
                        if (comp.op == ComparisonOp::CrossesAbove) {
                            for (std::size_t i = 1; i < n; ++i) {
                                result[i] = (left[i] > right[i]) && (left[i - 1] <= right[i - 1]);
                            }
                        } else if (comp.op == ComparisonOp::CrossesBelow) {
                            for (std::size_t i = 1; i < n; ++i) {
                                result[i] = (left[i] < right[i]) && (left[i - 1] >= right[i - 1]);
                            }
                        } else {
                            // NaN compares false, so warm-up bars resolve to false here
                            for (std::size_t i = 0; i < n; ++i) {
                                result[i] = compareAt(comp.op, left[i], right[i]);
                            }
                        }
                        return result;
                    },
                    [this, n](const ast::BoolCombinator& comb) {
                        const bool seed = comb.kind == BoolKind::And;
                        core::SignalSeries result(n, seed);
                        for (const auto& child : comb.children) {
                            const core::SignalSeries part = condition(*child);
                            for (std::size_t i = 0; i < n; ++i) {
                                result[i] = seed ? (result[i] && part[i]) : (result[i] || part[i]);
                            }
                        }
                        return result;
                    },
                    [&node](const auto&) -> core::SignalSeries {
                        throw core::RuntimeError(fmt::format(
                            "Numeric {} used where a condition is required", ast::kindName(node)));
                    }
                }, node.value);
            }

        private:
            const Column& fieldColumn(PriceField field) {
                auto it = fields_.find(field);
                if (it != fields_.end()) {
                    return it->second;
                }
                Column column;
                column.reserve(prices_.size());
                for (const auto& candle : prices_) {
                    switch (field) {
                        case PriceField::Open: column.push_back(candle.open); break;
                        case PriceField::High: column.push_back(candle.high); break;
                        case PriceField::Low: column.push_back(candle.low); break;
                        case PriceField::Close: column.push_back(candle.close); break;
                        case PriceField::Volume: column.push_back(static_cast<double>(candle.volume)); break;
                    }
                }
                return fields_.emplace(field, std::move(column)).first->second;
            }

            double parameterOf(const std::string& key, const ast::Indicator& ind) const {
                if (ind.args.size() < 2) {
                    throw core::RuntimeError(fmt::format("Error computing {}: missing parameter", key), ind.name);
                }
                const auto* lit = std::get_if<ast::Literal>(&ind.args[1]->value);
                if (lit == nullptr) {
                    throw core::RuntimeError(fmt::format("Error computing {}: parameter is not a literal", key), ind.name);
                }
                if (const auto* i = std::get_if<long long>(&lit->value)) {
                    return static_cast<double>(*i);
                }
                if (const auto* d = std::get_if<double>(&lit->value)) {
                    return *d;
                }
                throw core::RuntimeError(fmt::format("Error computing {}: parameter is boolean", key), ind.name);
            }

            // Computes the column for `key` once; nested calls materialize on demand.
            const Column& materialize(const std::string& key, const ast::Indicator& ind) {
                auto it = columns_.find(key);
                if (it != columns_.end()) {
                    return it->second;
                }

                auto logger = core::logging::getLogger();
                Column result;
                try {
                    const Column series = numeric(*ind.args.at(0));
                    const double parameter = parameterOf(key, ind);
                    result = indicators::compute(ind.kind, series, parameter);
                } catch (const core::QuantDslException&) {
                    throw;
                } catch (const std::exception& e) {
                    throw core::RuntimeError(fmt::format("Error computing {}: {}", key, e.what()), ind.name);
                }

                if (result.size() != prices_.size()) {
                    throw core::RuntimeError(fmt::format(
                        "Error computing {}: produced {} values for {} bars", key, result.size(), prices_.size()), ind.name);
                }

                logger->debug("Materialized indicator '{}'", key);
                if (trace_ != nullptr) {
                    trace_->materialization_order.push_back(key);
                    ++trace_->computation_counts[key];
                }
                return columns_.emplace(key, std::move(result)).first->second;
            }

            const core::PriceTable& prices_;
            const IndicatorCache& cache_;
            EvaluationTrace* trace_;
            std::map<std::string, Column> columns_;
            std::map<PriceField, Column> fields_;
        };

    } // end anonymous namespace

    CompiledStrategy::CompiledStrategy(ast::Strategy strategy) : strategy_(std::move(strategy)) {
        if (!strategy_.entry || !strategy_.exit) {
            throw core::ValidationError("Strategy requires both an ENTRY and an EXIT expression");
        }
        // Explicit collection pass over both trees before any evaluation
        cache_.collect(strategy_.entry);
        cache_.collect(strategy_.exit);
        core::logging::getLogger()->debug("Compiled strategy with {} distinct indicator call(s)", cache_.size());
    }

    SignalPair CompiledStrategy::evaluate(const core::PriceTable& prices, EvaluationTrace* trace) const {
        auto logger = core::logging::getLogger();
        validatePriceIndex(prices);

        EvaluationContext context(prices, cache_, trace);
        context.materializeAll();

        SignalPair signals;
        signals.entry = context.condition(*strategy_.entry);
        signals.exit = context.condition(*strategy_.exit);
        logger->debug("Evaluated signals over {} bars", prices.size());
        return signals;
    }

    CompiledStrategy compileDsl(const std::string& dsl_text) {
        return CompiledStrategy(compileStrategy(dsl_text));
    }

} // namespace strategy_engine
