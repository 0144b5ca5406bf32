#pragma once

#include "ast.hpp"
#include "indicator_cache.hpp"
#include "datatypes.hpp"
#include <map>
#include <string>
#include <vector>

namespace strategy_engine {

    // Entry and exit signals, both aligned 1:1 with the evaluated price table.
    struct SignalPair {
        core::SignalSeries entry;
        core::SignalSeries exit;
    };

    // Optional instrumentation filled by CompiledStrategy::evaluate.
    struct EvaluationTrace {
        std::vector<std::string> materialization_order;   // Keys in the order they were computed
        std::map<std::string, int> computation_counts;    // Key -> times computed during the run
    };

    // --- CompiledStrategy ---
    // A validated strategy with its indicator cache collected up front.
    // evaluate() is const and builds a fresh evaluation context per call, so
    // one compiled strategy can be run over any number of price tables.
    class CompiledStrategy {
    public:
        explicit CompiledStrategy(ast::Strategy strategy);

        // Throws core::ValidationError if timestamps are not strictly
        // increasing, core::RuntimeError if an indicator cannot be computed.
        SignalPair evaluate(const core::PriceTable& prices, EvaluationTrace* trace = nullptr) const;

        const ast::Strategy& strategy() const { return strategy_; }
        const IndicatorCache& cache() const { return cache_; }

        // Canonical keys in materialization order (sorted)
        std::vector<std::string> indicatorKeys() const { return cache_.keys(); }

    private:
        ast::Strategy strategy_;
        IndicatorCache cache_;
    };

    // Parse, build and compile DSL text in one step.
    CompiledStrategy compileDsl(const std::string& dsl_text);

} // namespace strategy_engine
