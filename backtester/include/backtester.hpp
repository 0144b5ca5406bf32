#pragma once

#include <optional>
#include <vector>

// Required project headers (use short paths)
#include "datatypes.hpp"
#include "portfolio.hpp"        // Portfolio class, BacktestMetrics

namespace backtester {

    // Everything one run produces. The equity curve has one point per bar.
    struct BacktestResult {
        BacktestMetrics metrics;
        std::vector<PortfolioState> equity_curve;
        std::vector<core::Trade> trades;
        std::optional<core::Position> open_position;   // Still open after the last bar (not in trades)
    };

    // --- Backtester ---
    // Two-state (NO_POSITION / IN_POSITION) long-only simulation over one
    // instrument. Each bar, in order:
    //   - undefined entry or exit signal: no transition, equity carried forward
    //   - NO_POSITION and entry: buy at the close with all equity
    //   - IN_POSITION and exit:  sell at the close, record the trade
    //   - IN_POSITION otherwise: mark to market at the close
    // Entry is never checked while in a position and exit never while flat,
    // so a bar cannot both open and close a trade.
    class Backtester {
    public:
        explicit Backtester(double initial_capital = 10000.0);

        // Throws core::BacktestException if the signal lengths differ from the price table.
        BacktestResult run(const core::PriceTable& prices,
                           const core::OptionalSignalSeries& entry_signals,
                           const core::OptionalSignalSeries& exit_signals) const;

        BacktestResult run(const core::PriceTable& prices,
                           const core::SignalSeries& entry_signals,
                           const core::SignalSeries& exit_signals) const;

        double getInitialCapital() const { return initial_capital_; }

        // Aggregate metrics from a finished run.
        static BacktestMetrics calculateMetrics(const Portfolio& portfolio);

    private:
        double initial_capital_;
    };

} // namespace backtester
