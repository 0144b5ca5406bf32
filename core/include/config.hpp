#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace core {

    using json = nlohmann::json;

    enum class DataSource {
        Csv,
        Sqlite
    };

    // Where the price table comes from
    struct DataConfig {
        DataSource source = DataSource::Csv;
        std::string path;                // CSV file or SQLite database
        std::string instrument;          // SQLite only
        std::string interval = "day";    // SQLite only
        std::string start_date;          // YYYY-MM-DD, optional
        std::string end_date;            // YYYY-MM-DD, optional
    };

    struct RunConfig {
        double initial_capital = 10000.0;
        std::string log_level = "info";
        std::string log_file = "quantdsl";
        std::string strategy_file;       // DSL text
        std::string ir_file;             // JSON IR, alternative to strategy_file
        std::string results_file;        // Optional JSON output
        DataConfig data;

        // Throws ConfigException on wrong types or out-of-range values.
        static RunConfig fromJson(const json& config);
        static RunConfig fromFile(const std::string& path);

        // Re-checks values after command-line overrides were applied.
        void validate() const;
    };

    DataSource dataSourceFromString(const std::string& source);

} // namespace core
