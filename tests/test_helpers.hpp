#pragma once

#include "datatypes.hpp"
#include "utils.hpp"
#include <chrono>
#include <cstddef>
#include <vector>

namespace test_helpers {

    // Daily bars starting 2023-01-02 with open = high = low = close.
    inline core::PriceTable makePrices(const std::vector<double>& closes) {
        const core::Timestamp start = core::utils::stringToTimestamp("2023-01-02");
        core::PriceTable prices;
        prices.reserve(closes.size());
        for (std::size_t i = 0; i < closes.size(); ++i) {
            core::Candle candle;
            candle.timestamp = start + std::chrono::hours(24 * static_cast<int>(i));
            candle.open = closes[i];
            candle.high = closes[i];
            candle.low = closes[i];
            candle.close = closes[i];
            candle.volume = 1000 + static_cast<long long>(i);
            prices.push_back(candle);
        }
        return prices;
    }

    inline core::PriceTable makeFlatPrices(std::size_t bars, double price) {
        return makePrices(std::vector<double>(bars, price));
    }

    // Slow upward drift with a saw-tooth so crossings and RSI both have work to do.
    inline core::PriceTable makeWavePrices(std::size_t bars) {
        std::vector<double> closes;
        closes.reserve(bars);
        for (std::size_t i = 0; i < bars; ++i) {
            const double wave = static_cast<double>(i % 10) - 5.0;
            closes.push_back(100.0 + 0.3 * static_cast<double>(i) + wave);
        }
        return makePrices(closes);
    }

    inline core::SignalSeries signalsAt(std::size_t bars, const std::vector<std::size_t>& true_at) {
        core::SignalSeries signals(bars, false);
        for (std::size_t i : true_at) {
            signals.at(i) = true;
        }
        return signals;
    }

} // namespace test_helpers
