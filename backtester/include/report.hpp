#pragma once

#include "backtester.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace backtester {

    // Metrics rounded to 2 decimals. max_drawdown is in percent; an infinite
    // profit factor is written as the string "inf".
    nlohmann::json toJson(const BacktestMetrics& metrics);

    nlohmann::json toJson(const core::Trade& trade);

    // {"metrics": {...}, "trades": [...], "equity_curve": [...], "open_position": {...} | null}
    nlohmann::json toJson(const BacktestResult& result);

    // Human-readable summary block followed by the trade log table.
    std::string formatReport(const BacktestResult& result);

} // namespace backtester
