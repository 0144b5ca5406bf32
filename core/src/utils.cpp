#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <iomanip> // For std::put_time, std::get_time
#include <sstream> // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <algorithm>
#include <cctype>
#include <cmath>      // For std::pow
#include <ctime>

namespace core {
namespace utils {

    Timestamp stringToTimestamp(const std::string& iso_string) {
        const std::string text = trim(iso_string);
        std::tm tm = {};
        std::istringstream ss(text);

        // 1. Date part, optionally followed by a time part
        if (text.size() == 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        } else if (text.size() > 10 && (text[10] == 'T' || text[10] == ' ')) {
            std::string normalized = text;
            normalized[10] = 'T';
            ss.str(normalized);
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        } else {
            throw std::runtime_error("Failed to parse timestamp (unrecognized layout): " + iso_string);
        }
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Manually parse optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) { // Limit precision to nanoseconds
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Optional timezone offset (+HH:MM, -HH:MM, or Z); absent means UTC
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        }

        // 4. timegm interprets struct tm as UTC; the offset is applied afterwards.
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == static_cast<time_t>(-1)) {
             throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    namespace {
        std::tm toUtcTm(const Timestamp& ts) {
            auto tt = std::chrono::system_clock::to_time_t(ts);
            std::tm time_tm;
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }
    } // namespace

    std::string timestampToString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    std::string timestampToDate(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string toUpper(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
            [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
        return text;
    }

    std::string trim(const std::string& text) {
        const auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return {};
        }
        const auto last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    std::string formatNumber(double value) {
        return fmt::format("{}", value);
    }

} // namespace utils
} // namespace core
