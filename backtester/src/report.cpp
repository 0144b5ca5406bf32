#include "report.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <string>

namespace backtester {

    using json = nlohmann::json; // Alias

    namespace {

        double round2(double value) {
            return std::round(value * 100.0) / 100.0;
        }

        const std::string kRule(60, '=');

    } // namespace

    json toJson(const BacktestMetrics& metrics) {
        json j;
        j["total_trades"] = metrics.total_trades;
        j["winning_trades"] = metrics.winning_trades;
        j["losing_trades"] = metrics.losing_trades;
        j["win_rate"] = round2(metrics.win_rate);
        j["total_return"] = round2(metrics.total_return);
        j["total_return_pct"] = round2(metrics.total_return_pct);
        j["max_drawdown"] = round2(metrics.max_drawdown_pct);
        j["average_return"] = round2(metrics.average_return);
        j["average_win"] = round2(metrics.average_win);
        j["average_loss"] = round2(metrics.average_loss);
        if (std::isinf(metrics.profit_factor)) {
            j["profit_factor"] = "inf";
        } else {
            j["profit_factor"] = round2(metrics.profit_factor);
        }
        j["sharpe_ratio"] = round2(metrics.sharpe_ratio);
        j["final_equity"] = round2(metrics.final_equity);
        j["initial_equity"] = metrics.initial_capital;
        return j;
    }

    json toJson(const core::Trade& trade) {
        return json{
            {"entry_date", core::utils::timestampToString(trade.entry_time)},
            {"exit_date", core::utils::timestampToString(trade.exit_time)},
            {"entry_price", trade.entry_price},
            {"exit_price", trade.exit_price},
            {"shares", trade.share_count},
            {"pnl", trade.pnl},
            {"pnl_pct", trade.pnl_pct},
            {"return", trade.pnl_pct * 100.0}
        };
    }

    json toJson(const BacktestResult& result) {
        json trades = json::array();
        for (const auto& trade : result.trades) {
            trades.push_back(toJson(trade));
        }

        json curve = json::array();
        for (const auto& point : result.equity_curve) {
            curve.push_back({{"timestamp", core::utils::timestampToString(point.timestamp)},
                             {"equity", point.total_equity}});
        }

        json open_position = nullptr;
        if (result.open_position) {
            open_position = {
                {"entry_date", core::utils::timestampToString(result.open_position->entry_time)},
                {"entry_price", result.open_position->entry_price},
                {"shares", result.open_position->share_count}
            };
        }

        return json{
            {"metrics", toJson(result.metrics)},
            {"trades", trades},
            {"equity_curve", curve},
            {"open_position", open_position}
        };
    }

    std::string formatReport(const BacktestResult& result) {
        const BacktestMetrics& m = result.metrics;
        std::string out;
        out += kRule + "\n";
        out += " BACKTEST RESULTS\n";
        out += kRule + "\n\n";
        out += fmt::format("Initial Capital: ${:.2f}\n", m.initial_capital);
        out += fmt::format("Final Equity:    ${:.2f}\n", m.final_equity);
        out += fmt::format("Total Return:    ${:.2f} ({:.2f}%)\n", m.total_return, m.total_return_pct);
        out += fmt::format("Max Drawdown:    {:.2f}%\n\n", m.max_drawdown_pct);
        out += fmt::format("Total Trades:    {}\n", m.total_trades);
        out += fmt::format("Winning Trades:  {}\n", m.winning_trades);
        out += fmt::format("Losing Trades:   {}\n", m.losing_trades);
        out += fmt::format("Win Rate:        {:.2f}%\n\n", m.win_rate);
        out += fmt::format("Average Return:  {:.2f}%\n", m.average_return);
        out += fmt::format("Average Win:     {:.2f}%\n", m.average_win);
        out += fmt::format("Average Loss:    {:.2f}%\n", m.average_loss);
        out += fmt::format("Profit Factor:   {:.2f}\n", m.profit_factor);
        out += fmt::format("Sharpe Ratio:    {:.2f}\n", m.sharpe_ratio);

        if (!result.trades.empty()) {
            out += "\n" + kRule + "\n";
            out += " TRADE LOG\n";
            out += kRule + "\n";
            out += fmt::format("{:<12} {:<12} {:<10} {:<10} {:<10}\n", "Entry Date", "Exit Date", "Entry $", "Exit $", "Return");
            out += std::string(60, '-') + "\n";
            for (const auto& trade : result.trades) {
                out += fmt::format("{:<12} {:<12} {:<10} {:<10} {:<10}\n",
                                   core::utils::timestampToDate(trade.entry_time),
                                   core::utils::timestampToDate(trade.exit_time),
                                   fmt::format("${:.2f}", trade.entry_price),
                                   fmt::format("${:.2f}", trade.exit_price),
                                   fmt::format("{:.2f}%", trade.pnl_pct * 100.0));
            }
        }

        if (result.open_position) {
            out += fmt::format("\nOpen position: entered {} @ ${:.2f} (marked to market, not in trade log)\n",
                               core::utils::timestampToDate(result.open_position->entry_time),
                               result.open_position->entry_price);
        }
        out += kRule + "\n";
        return out;
    }

} // namespace backtester
