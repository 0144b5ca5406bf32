#pragma once

#include "datatypes.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace data {

// --- CsvLoader ---
// Reads OHLCV candles from a CSV file with a header row:
//
//   Date,Open,High,Low,Close,Adj Close,Volume
//   2023-01-03,130.28,130.90,124.17,125.07,124.21,112117500
//
// Columns are located by name (case-insensitive); the timestamp column may be
// called date, timestamp or datetime. Extra columns are ignored. Rows that do
// not parse or fail basic price checks are skipped with a warning.
class CsvLoader {
public:
    // Throws core::DataLoadException if the file cannot be read, the header
    // lacks a required column, no valid rows remain, or timestamps are not
    // strictly increasing.
    static core::PriceTable load(const std::string& path);

    // Same, from CSV text already in memory. `source` names it in messages.
    static core::PriceTable parse(const std::string& csv_text, const std::string& source = "<memory>");

private:
    static std::vector<std::string> split(const std::string& line, char delimiter);
};

} // namespace data
