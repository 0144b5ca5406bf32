#pragma once

#include "backtester.hpp"
#include "ast.hpp"
#include "datatypes.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace backtester {

    struct PipelineResult {
        std::string dsl_text;
        strategy_engine::ast::Strategy strategy;
        std::vector<std::string> indicator_keys;   // In materialization order
        core::SignalSeries entry_signals;
        core::SignalSeries exit_signals;
        std::size_t entry_signal_count = 0;
        std::size_t exit_signal_count = 0;
        BacktestResult backtest;
    };

    // --- Pipeline ---
    // DSL text -> AST -> signals -> backtest, in one call. Any stage failure
    // propagates as its core::QuantDslException subtype; nothing partial is
    // returned.
    class Pipeline {
    public:
        static PipelineResult runFromDsl(const std::string& dsl_text,
                                         const core::PriceTable& prices,
                                         double initial_capital = 10000.0);

        // Renders the JSON IR as DSL first (strategy_engine::JsonToDsl).
        static PipelineResult runFromJson(const nlohmann::json& ir,
                                          const core::PriceTable& prices,
                                          double initial_capital = 10000.0);
    };

} // namespace backtester
