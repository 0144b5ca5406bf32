#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <optional>

namespace core {

    // Using system_clock for time points, can be adjusted if needed
    using Timestamp = std::chrono::system_clock::time_point;

    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Basic TimeSeries concept
    template<typename T>
    using TimeSeries = std::vector<T>;

    // The evaluator and the backtester both work on one instrument's bars.
    using PriceTable = TimeSeries<Candle>;

    // Aligned boolean decisions, one per bar.
    using SignalSeries = TimeSeries<bool>;

    // Backtester input: an empty value marks a bar whose signal is undefined (warm-up).
    using OptionalSignalSeries = TimeSeries<std::optional<bool>>;

    // Two-state simulation model (single position, fully invested)
    enum class PositionState {
        NoPosition,
        InPosition
    };

    // Ephemeral: exists only while IN_POSITION
    struct Position {
        Timestamp entry_time;
        double entry_price = 0.0;
        double share_count = 0.0;   // Fractional, equity / entry_price
    };

    // Closed round trip, appended to the ledger on exit
    struct Trade {
        Timestamp entry_time;
        Timestamp exit_time;
        double entry_price = 0.0;
        double exit_price = 0.0;
        double share_count = 0.0;
        double pnl = 0.0;             // share_count * (exit_price - entry_price)
        double pnl_pct = 0.0;         // exit_price / entry_price - 1 (fraction)
    };

} // namespace core
