// backtester/include/portfolio.hpp
#pragma once

#include <optional>
#include <vector>

// Use short paths
#include "datatypes.hpp" // Provides core::Timestamp, core::Position, core::Trade
#include "logging.hpp"   // Provides core::logging::getLogger needed by BacktestMetrics::logMetrics

namespace backtester {

    // --- Backtest Metrics Struct ---
    // Values are kept unrounded; reports round for display.
    struct BacktestMetrics {
        int total_trades = 0;
        int winning_trades = 0;          // pnl > 0
        int losing_trades = 0;           // pnl < 0
        double win_rate = 0.0;           // Percent of total_trades
        double total_return = 0.0;       // final_equity - initial_capital
        double total_return_pct = 0.0;   // Percent of initial_capital
        double average_return = 0.0;     // Mean per-trade return, percent
        double average_win = 0.0;        // Mean winning-trade return, percent
        double average_loss = 0.0;       // Mean losing-trade return, percent
        double profit_factor = 0.0;      // Gross profit / |gross loss|; +inf with no losses
        double sharpe_ratio = 0.0;       // mean(r) / pstdev(r) * sqrt(252 / N)
        double max_drawdown = 0.0;       // Fraction, <= 0
        double max_drawdown_pct = 0.0;   // Percent, <= 0
        double initial_capital = 0.0;
        double final_equity = 0.0;

        // Helper method to log calculated metrics
        void logMetrics() const {
            auto logger = core::logging::getLogger();
            logger->info("--- Backtest Metrics ---");
            logger->info("Initial Capital: {:.2f}", initial_capital);
            logger->info("Final Equity: {:.2f}", final_equity);
            logger->info("Total Return: {:.2f} ({:.2f}%)", total_return, total_return_pct);
            logger->info("Max Drawdown: {:.2f}%", max_drawdown_pct);
            logger->info("Total Trades: {} (won {}, lost {})", total_trades, winning_trades, losing_trades);
            logger->info("Win Rate: {:.2f}%", win_rate);
            logger->info("Average Return: {:.2f}% (win {:.2f}%, loss {:.2f}%)", average_return, average_win, average_loss);
            logger->info("Profit Factor: {:.2f}", profit_factor);
            logger->info("Sharpe Ratio: {:.2f}", sharpe_ratio);
            logger->info("------------------------");
        }
    };

    // --- Portfolio State Struct (for equity curve) ---
    struct PortfolioState {
        core::Timestamp timestamp;
        double cash = 0.0;
        double positions_value = 0.0; // Market value of the open position
        double total_equity = 0.0;   // cash + positions_value
    };

    // --- Portfolio Class Definition ---
    // Simulation context for one backtest run: a single instrument, at most one
    // fully invested long position, a trade ledger and the per-bar equity curve.
    // A new Portfolio is created for every run.
    class Portfolio {
    public:
        explicit Portfolio(double initial_capital);

        // --- Getters ---
        double getInitialCapital() const { return initial_capital_; }
        double getCash() const { return cash_; }
        double getEquity() const { return equity_; }
        core::PositionState getState() const { return state_; }
        const std::optional<core::Position>& getOpenPosition() const { return open_position_; }
        const std::vector<PortfolioState>& getEquityCurve() const { return equity_curve_; }
        const std::vector<core::Trade>& getTradeLog() const { return trade_log_; }
        double getPeakEquity() const { return peak_equity_; }
        double getMaxDrawdown() const { return max_drawdown_; }   // Fraction, <= 0

        // --- Modifiers ---
        // NO_POSITION -> IN_POSITION. Buys equity / price shares.
        void openPosition(core::Timestamp timestamp, double price);

        // IN_POSITION -> NO_POSITION. Appends the closed trade and returns it.
        const core::Trade& closePosition(core::Timestamp timestamp, double price);

        // IN_POSITION: equity becomes share_count * price.
        void markToMarket(double price);

        // Appends the current equity to the curve and updates peak/drawdown.
        void recordTimestampValue(core::Timestamp timestamp);

        // Appends the current equity without touching peak/drawdown (undefined signal bars).
        void recordCarryForward(core::Timestamp timestamp);

    private:
        PortfolioState currentState(core::Timestamp timestamp) const;

        double initial_capital_;
        double cash_;
        double equity_;
        core::PositionState state_ = core::PositionState::NoPosition;
        std::optional<core::Position> open_position_;
        double peak_equity_;
        double max_drawdown_ = 0.0;
        // Vector storing historical portfolio state (for equity curve / drawdown)
        std::vector<PortfolioState> equity_curve_;
        // Vector storing details of completed round-trip trades
        std::vector<core::Trade> trade_log_;
    };

} // namespace backtester
