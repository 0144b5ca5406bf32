#include "backtester.hpp"
#include "logging.hpp"          // Use short path
#include "utils.hpp"            // Use short path
#include "exceptions.hpp"       // Use short path
#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <limits>
#include <numeric>

namespace backtester {

    namespace {

        core::OptionalSignalSeries toOptional(const core::SignalSeries& signals) {
            return core::OptionalSignalSeries(signals.begin(), signals.end());
        }

        double mean(const std::vector<double>& values) {
            if (values.empty()) return 0.0;
            return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        }

        // Population standard deviation
        double pstdev(const std::vector<double>& values) {
            if (values.empty()) return 0.0;
            const double mu = mean(values);
            double sum_sq = 0.0;
            for (double v : values) {
                sum_sq += (v - mu) * (v - mu);
            }
            return std::sqrt(sum_sq / static_cast<double>(values.size()));
        }

    } // namespace

    Backtester::Backtester(double initial_capital)
        : initial_capital_(initial_capital)
    {
        if (!(initial_capital > 0)) {
            throw core::BacktestException(fmt::format("Initial capital must be positive, got {}", initial_capital));
        }
        core::logging::getLogger()->debug("Backtester initialized with capital: {}", initial_capital_);
    }

    BacktestResult Backtester::run(const core::PriceTable& prices,
                                   const core::SignalSeries& entry_signals,
                                   const core::SignalSeries& exit_signals) const {
        return run(prices, toOptional(entry_signals), toOptional(exit_signals));
    }

    BacktestResult Backtester::run(const core::PriceTable& prices,
                                   const core::OptionalSignalSeries& entry_signals,
                                   const core::OptionalSignalSeries& exit_signals) const {
        auto logger = core::logging::getLogger();
        if (entry_signals.size() != prices.size() || exit_signals.size() != prices.size()) {
            throw core::BacktestException(fmt::format(
                "Signal length mismatch: {} bars, {} entry signals, {} exit signals",
                prices.size(), entry_signals.size(), exit_signals.size()));
        }

        logger->info("Starting backtest over {} bars with capital {:.2f}", prices.size(), initial_capital_);

        // Fresh simulation context for every run
        Portfolio portfolio(initial_capital_);

        for (std::size_t i = 0; i < prices.size(); ++i) {
            const core::Candle& candle = prices[i];

            // Insufficient data for indicators: no decision on this bar
            if (!entry_signals[i].has_value() || !exit_signals[i].has_value()) {
                portfolio.recordCarryForward(candle.timestamp);
                continue;
            }

            if (portfolio.getState() == core::PositionState::NoPosition) {
                if (*entry_signals[i]) {
                    portfolio.openPosition(candle.timestamp, candle.close);
                }
            } else if (*exit_signals[i]) {
                portfolio.closePosition(candle.timestamp, candle.close);
            } else {
                portfolio.markToMarket(candle.close);
            }

            portfolio.recordTimestampValue(candle.timestamp);
        }

        BacktestResult result;
        result.metrics = calculateMetrics(portfolio);
        result.equity_curve = portfolio.getEquityCurve();
        result.trades = portfolio.getTradeLog();
        result.open_position = portfolio.getOpenPosition();

        if (result.open_position) {
            logger->info("Position opened {} still open after the last bar; marked to market, not in the trade log.",
                         core::utils::timestampToString(result.open_position->entry_time));
        }
        logger->info("Backtest finished: {} trades, final equity {:.2f}",
                     result.metrics.total_trades, result.metrics.final_equity);
        return result;
    }

    BacktestMetrics Backtester::calculateMetrics(const Portfolio& portfolio) {
        auto logger = core::logging::getLogger();
        logger->debug("Calculating performance metrics...");

        const auto& equity_curve = portfolio.getEquityCurve();
        const auto& trade_log = portfolio.getTradeLog();

        BacktestMetrics metrics;
        metrics.initial_capital = portfolio.getInitialCapital();
        metrics.max_drawdown = portfolio.getMaxDrawdown();
        metrics.max_drawdown_pct = metrics.max_drawdown * 100.0;
        metrics.final_equity = metrics.initial_capital;

        if (trade_log.empty()) {
            logger->debug("No closed trades; trade metrics stay at zero.");
            return metrics;
        }

        // --- PnL and Return ---
        metrics.final_equity = equity_curve.empty() ? metrics.initial_capital : equity_curve.back().total_equity;
        metrics.total_return = metrics.final_equity - metrics.initial_capital;
        metrics.total_return_pct = metrics.total_return / metrics.initial_capital * 100.0;

        // --- Trade-Based Metrics ---
        metrics.total_trades = static_cast<int>(trade_log.size());
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        std::vector<double> returns;
        std::vector<double> winning_returns;
        std::vector<double> losing_returns;
        returns.reserve(trade_log.size());

        for (const auto& trade : trade_log) {
            const double return_pct = trade.pnl_pct * 100.0;
            returns.push_back(return_pct);
            if (trade.pnl > 0) {
                metrics.winning_trades++;
                gross_profit += trade.pnl;
                winning_returns.push_back(return_pct);
            } else if (trade.pnl < 0) {
                metrics.losing_trades++;
                gross_loss += trade.pnl; // Loss is negative
                losing_returns.push_back(return_pct);
            }
            // Trades with PnL == 0 count toward the total only
        }

        metrics.win_rate = static_cast<double>(metrics.winning_trades) / metrics.total_trades * 100.0;
        metrics.average_return = mean(returns);
        metrics.average_win = mean(winning_returns);
        metrics.average_loss = mean(losing_returns);

        if (gross_loss < 0) {
            metrics.profit_factor = gross_profit / std::abs(gross_loss);
        } else if (gross_profit > 0) {
            metrics.profit_factor = std::numeric_limits<double>::infinity();
        } else {
            metrics.profit_factor = 0.0;
        }

        // Per-trade returns annualized with a fixed 252 / N factor
        if (returns.size() >= 2) {
            const double stdev = pstdev(returns);
            if (stdev > 0) {
                metrics.sharpe_ratio = mean(returns) / stdev * std::sqrt(252.0 / static_cast<double>(returns.size()));
            }
        }

        return metrics;
    }

} // namespace backtester
