#include "csv_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace data {

namespace {

    struct ColumnLayout {
        std::size_t timestamp = 0;
        std::size_t open = 0;
        std::size_t high = 0;
        std::size_t low = 0;
        std::size_t close = 0;
        std::size_t volume = 0;
        std::size_t width = 0;   // Minimum number of fields a row needs
    };

    std::optional<std::size_t> findColumn(const std::vector<std::string>& header,
                                          std::initializer_list<const char*> names) {
        for (std::size_t i = 0; i < header.size(); ++i) {
            const std::string column = core::utils::toLower(header[i]);
            for (const char* name : names) {
                if (column == name) {
                    return i;
                }
            }
        }
        return std::nullopt;
    }

    ColumnLayout resolveLayout(const std::vector<std::string>& header, const std::string& source) {
        ColumnLayout layout;
        std::size_t widest = 0;
        auto require = [&](std::initializer_list<const char*> names, const char* label) {
            auto index = findColumn(header, names);
            if (!index) {
                throw core::DataLoadException(fmt::format(
                    "CSV '{}' is missing required column '{}'. Required: date, open, high, low, close, volume",
                    source, label));
            }
            widest = std::max(widest, *index);
            return *index;
        };
        layout.timestamp = require({"date", "timestamp", "datetime"}, "date");
        layout.open = require({"open"}, "open");
        layout.high = require({"high"}, "high");
        layout.low = require({"low"}, "low");
        layout.close = require({"close"}, "close");
        layout.volume = require({"volume"}, "volume");
        layout.width = widest + 1;
        return layout;
    }

    bool isValidCandle(const core::Candle& candle) {
        return candle.open > 0.0 && candle.high > 0.0 && candle.low > 0.0 && candle.close > 0.0 &&
               candle.high >= candle.low && candle.volume >= 0;
    }

} // namespace

std::vector<std::string> CsvLoader::split(const std::string& line, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::stringstream ss(line);
    while (std::getline(ss, token, delimiter)) {
        tokens.push_back(core::utils::trim(token));
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == delimiter) {
        tokens.emplace_back();
    }
    return tokens;
}

core::PriceTable CsvLoader::load(const std::string& path) {
    auto logger = core::logging::getLogger();
    std::ifstream file(path);
    if (!file.is_open()) {
        throw core::DataLoadException(fmt::format("Cannot open CSV file: {}", path));
    }
    logger->info("Loading candles from CSV: {}", path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), path);
}

core::PriceTable CsvLoader::parse(const std::string& csv_text, const std::string& source) {
    auto logger = core::logging::getLogger();
    std::istringstream input(csv_text);
    std::string line;

    // Header: first non-empty line
    std::vector<std::string> header;
    while (std::getline(input, line)) {
        if (!core::utils::trim(line).empty()) {
            header = split(core::utils::trim(line), ',');
            break;
        }
    }
    if (header.empty()) {
        throw core::DataLoadException(fmt::format("CSV '{}' is empty", source));
    }
    const ColumnLayout layout = resolveLayout(header, source);

    core::PriceTable candles;
    std::size_t line_number = 1;
    std::size_t skipped = 0;
    while (std::getline(input, line)) {
        ++line_number;
        const std::string trimmed = core::utils::trim(line);
        if (trimmed.empty()) continue;

        const auto fields = split(trimmed, ',');
        if (fields.size() < layout.width) {
            logger->warn("{}:{}: expected at least {} fields, found {}. Row skipped.",
                         source, line_number, layout.width, fields.size());
            ++skipped;
            continue;
        }

        try {
            core::Candle candle;
            candle.timestamp = core::utils::stringToTimestamp(fields[layout.timestamp]);
            candle.open = std::stod(fields[layout.open]);
            candle.high = std::stod(fields[layout.high]);
            candle.low = std::stod(fields[layout.low]);
            candle.close = std::stod(fields[layout.close]);
            // Some sources write volume as a float ("1.2e6")
            candle.volume = static_cast<long long>(std::stod(fields[layout.volume]));

            if (!isValidCandle(candle)) {
                logger->warn("{}:{}: invalid prices (high < low or non-positive). Row skipped.", source, line_number);
                ++skipped;
                continue;
            }
            candles.push_back(candle);
        } catch (const std::exception& e) {
            logger->warn("{}:{}: {}. Row skipped.", source, line_number, e.what());
            ++skipped;
        }
    }

    if (candles.empty()) {
        throw core::DataLoadException(fmt::format("CSV '{}' contains no valid candles ({} rows skipped)", source, skipped));
    }
    for (std::size_t i = 1; i < candles.size(); ++i) {
        if (!(candles[i - 1] < candles[i])) {
            throw core::DataLoadException(fmt::format(
                "CSV '{}': timestamps must be strictly increasing ({} is not after {})", source,
                core::utils::timestampToString(candles[i].timestamp),
                core::utils::timestampToString(candles[i - 1].timestamp)));
        }
    }

    logger->info("Loaded {} candles from {} ({} rows skipped)", candles.size(), source, skipped);
    return candles;
}

} // namespace data
