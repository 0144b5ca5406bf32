#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <fstream>
#include <spdlog/fmt/fmt.h>

namespace core {

    namespace {

        template <typename T>
        void readOptional(const json& object, const char* key, T& target) {
            if (!object.contains(key) || object[key].is_null()) {
                return;
            }
            try {
                target = object[key].get<T>();
            } catch (const json::exception& e) {
                throw ConfigException(fmt::format("Config key '{}' has the wrong type: {}", key, e.what()));
            }
        }

    } // namespace

    DataSource dataSourceFromString(const std::string& source) {
        const std::string lower = utils::toLower(source);
        if (lower == "csv") return DataSource::Csv;
        if (lower == "sqlite") return DataSource::Sqlite;
        throw ConfigException(fmt::format("Unknown data source: '{}'. Valid sources: csv, sqlite", source));
    }

    RunConfig RunConfig::fromJson(const json& config) {
        if (!config.is_object()) {
            throw ConfigException("Run config must be a JSON object.");
        }

        RunConfig run;
        readOptional(config, "initial_capital", run.initial_capital);
        readOptional(config, "log_level", run.log_level);
        readOptional(config, "log_file", run.log_file);
        readOptional(config, "strategy_file", run.strategy_file);
        readOptional(config, "ir_file", run.ir_file);
        readOptional(config, "results_file", run.results_file);

        if (config.contains("data")) {
            const json& data = config["data"];
            if (!data.is_object()) {
                throw ConfigException("Config key 'data' must be an object.");
            }
            std::string source = "csv";
            readOptional(data, "source", source);
            run.data.source = dataSourceFromString(source);
            readOptional(data, "path", run.data.path);
            readOptional(data, "instrument", run.data.instrument);
            readOptional(data, "interval", run.data.interval);
            readOptional(data, "start", run.data.start_date);
            readOptional(data, "end", run.data.end_date);
        }

        run.validate();
        return run;
    }

    RunConfig RunConfig::fromFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }
        json config;
        try {
            config = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }
        logging::getLogger()->debug("Loaded run config from {}", path);
        return fromJson(config);
    }

    void RunConfig::validate() const {
        if (!(initial_capital > 0.0)) {
            throw ConfigException(fmt::format("initial_capital must be positive, got {}", initial_capital));
        }
        if (data.source == DataSource::Sqlite && !data.path.empty() && data.instrument.empty()) {
            throw ConfigException("SQLite data source requires an 'instrument' key.");
        }
    }

} // namespace core
