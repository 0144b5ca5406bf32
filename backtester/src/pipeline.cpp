#include "pipeline.hpp"
#include "expression_evaluator.hpp"
#include "json_to_dsl.hpp"
#include "logging.hpp"
#include <algorithm>
#include <utility>

namespace backtester {

    PipelineResult Pipeline::runFromDsl(const std::string& dsl_text,
                                        const core::PriceTable& prices,
                                        double initial_capital) {
        auto logger = core::logging::getLogger();
        logger->info("Compiling strategy...");

        PipelineResult result;
        result.dsl_text = dsl_text;

        // Build the backtester first so a bad capital fails before any work
        Backtester backtester(initial_capital);

        const strategy_engine::CompiledStrategy compiled = strategy_engine::compileDsl(dsl_text);
        result.strategy = compiled.strategy();

        strategy_engine::EvaluationTrace trace;
        strategy_engine::SignalPair signals = compiled.evaluate(prices, &trace);
        result.indicator_keys = trace.materialization_order;
        result.entry_signal_count = static_cast<std::size_t>(std::count(signals.entry.begin(), signals.entry.end(), true));
        result.exit_signal_count = static_cast<std::size_t>(std::count(signals.exit.begin(), signals.exit.end(), true));
        logger->info("Signals: {} entry, {} exit over {} bars ({} indicators)",
                     result.entry_signal_count, result.exit_signal_count, prices.size(), result.indicator_keys.size());

        result.backtest = backtester.run(prices, signals.entry, signals.exit);
        result.entry_signals = std::move(signals.entry);
        result.exit_signals = std::move(signals.exit);
        return result;
    }

    PipelineResult Pipeline::runFromJson(const nlohmann::json& ir,
                                         const core::PriceTable& prices,
                                         double initial_capital) {
        const std::string dsl = strategy_engine::JsonToDsl::convert(ir);
        return runFromDsl(dsl, prices, initial_capital);
    }

} // namespace backtester
