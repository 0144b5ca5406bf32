#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Timestamp -> ISO 8601 in UTC, e.g. "2023-01-05T00:00:00Z"
    std::string timestampToString(const Timestamp& ts);

    // Timestamp -> "YYYY-MM-DD" (UTC calendar date)
    std::string timestampToDate(const Timestamp& ts);

    // Parses "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]" or the
    // same with a space separator. A missing offset is read as UTC.
    Timestamp stringToTimestamp(const std::string& iso_string);

    std::string toLower(std::string text);
    std::string toUpper(std::string text);
    std::string trim(const std::string& text);

    // Shortest representation that reads back to the same double ("20", "0.5", "1e+20")
    std::string formatNumber(double value);

} // namespace utils
} // namespace core
