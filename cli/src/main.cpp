// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <fstream>     // For std::ifstream / std::ofstream
#include <sstream>
#include <string>
#include <exception>   // Needed for std::exception
#include <memory>      // For std::shared_ptr

#include <boost/program_options.hpp>

// Include spdlog header directly for logger type if needed by catch blocks
#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>  // For json parsing

// Project includes
#include "logging.hpp"          // For logging functionality
#include "exceptions.hpp"       // For custom exception types
#include "config.hpp"           // RunConfig
#include "datatypes.hpp"        // For core::Candle, core::Timestamp, etc.
#include "utils.hpp"            // For timestampToString/stringToTimestamp helpers
#include "csv_loader.hpp"
#include "database_manager.hpp" // SQLite candle store
#include "ast_json.hpp"
#include "pipeline.hpp"
#include "report.hpp"

namespace po = boost::program_options;
using json = nlohmann::json;

namespace {

    void printUsage(const po::options_description& desc) {
        std::cout << "quantdsl - compile a trading strategy and backtest it\n\n";
        std::cout << "Usage: quantdsl (--strategy FILE | --ir FILE) (--data FILE | --db FILE --instrument KEY) [options]\n\n";
        std::cout << desc << std::endl;

        std::cout << "\nExamples:\n";
        std::cout << "  # DSL strategy over a CSV file\n";
        std::cout << "  quantdsl --strategy examples/sma_cross.dsl --data prices.csv --capital 10000\n\n";
        std::cout << "  # JSON IR strategy over candles stored in SQLite\n";
        std::cout << "  quantdsl --ir strategy.json --db market.db --instrument AAPL --start 2023-01-01 --end 2023-12-31\n\n";
        std::cout << "  # Store a CSV in the database, then run and write results\n";
        std::cout << "  quantdsl --strategy s.dsl --data prices.csv --db market.db --instrument AAPL --save-to-db --results out.json\n";
    }

    std::string readTextFile(const std::string& path, const char* what) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException(fmt::format("Failed to open {} file: {}", what, path));
        }
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return buffer.str();
    }

    json readJsonFile(const std::string& path, const char* what) {
        const std::string text = readTextFile(path, what);
        try {
            return json::parse(text);
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Failed to parse {} file '{}': {}", what, path, e.what()));
        }
    }

    // Command-line values win over the config file.
    void applyOverrides(const po::variables_map& vm, core::RunConfig& config) {
        if (vm.count("strategy")) config.strategy_file = vm["strategy"].as<std::string>();
        if (vm.count("ir")) config.ir_file = vm["ir"].as<std::string>();
        if (vm.count("capital")) config.initial_capital = vm["capital"].as<double>();
        if (vm.count("results")) config.results_file = vm["results"].as<std::string>();
        if (vm.count("log-level")) config.log_level = vm["log-level"].as<std::string>();

        if (vm.count("db")) {
            config.data.source = core::DataSource::Sqlite;
            config.data.path = vm["db"].as<std::string>();
        }
        if (vm.count("data")) {
            // A CSV given explicitly is the price source, even with --db (used by --save-to-db)
            config.data.source = core::DataSource::Csv;
            config.data.path = vm["data"].as<std::string>();
        }
        if (vm.count("instrument")) config.data.instrument = vm["instrument"].as<std::string>();
        if (vm.count("interval")) config.data.interval = vm["interval"].as<std::string>();
        if (vm.count("start")) config.data.start_date = vm["start"].as<std::string>();
        if (vm.count("end")) config.data.end_date = vm["end"].as<std::string>();
    }

    core::PriceTable loadFromDatabase(const core::DataConfig& data) {
        if (data.instrument.empty()) {
            throw core::ConfigException("SQLite data source requires --instrument.");
        }
        data::DatabaseManager db_manager(data.path);
        if (!db_manager.connect()) {
            throw core::DataLoadException(fmt::format("Failed to connect to SQLite database: {}", data.path));
        }
        if (!db_manager.initializeSchema()) {
            throw core::DataLoadException(fmt::format("Failed to initialize schema in: {}", data.path));
        }

        core::PriceTable candles;
        if (data.start_date.empty() && data.end_date.empty()) {
            candles = db_manager.queryAllCandles(data.instrument, data.interval);
        } else {
            const core::Timestamp start = core::utils::stringToTimestamp(
                data.start_date.empty() ? "0001-01-01" : data.start_date);
            const core::Timestamp end = core::utils::stringToTimestamp(
                (data.end_date.empty() ? "9999-12-31" : data.end_date) + "T23:59:59Z");
            candles = db_manager.queryCandles(data.instrument, data.interval, start, end);
        }
        if (candles.empty()) {
            throw core::DataLoadException(fmt::format(
                "No candles found for {} ({}) in {}", data.instrument, data.interval, data.path));
        }
        return candles;
    }

    void saveToDatabase(const core::PriceTable& candles, const std::string& db_path, const core::DataConfig& data) {
        if (data.instrument.empty()) {
            throw core::ConfigException("--save-to-db requires --instrument.");
        }
        data::DatabaseManager db_manager(db_path);
        if (!db_manager.connect() || !db_manager.initializeSchema()) {
            throw core::DataLoadException(fmt::format("Cannot open SQLite database for writing: {}", db_path));
        }
        if (!db_manager.saveCandles(candles, data.instrument, data.interval)) {
            throw core::DataLoadException(fmt::format("Failed to save candles to {}", db_path));
        }
    }

} // namespace

int main(int argc, char* argv[]) {
    // Define logger pointer early in the main scope
    std::shared_ptr<spdlog::logger> logger = nullptr;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show this help message")
        ("strategy,s", po::value<std::string>(), "Strategy DSL file")
        ("ir", po::value<std::string>(), "Strategy JSON IR file (alternative to --strategy)")
        ("data,d", po::value<std::string>(), "OHLCV CSV file")
        ("db", po::value<std::string>(), "SQLite candle database")
        ("instrument", po::value<std::string>(), "Instrument key in the database")
        ("interval", po::value<std::string>(), "Candle interval in the database (default: day)")
        ("start", po::value<std::string>(), "First date to load, YYYY-MM-DD")
        ("end", po::value<std::string>(), "Last date to load, YYYY-MM-DD")
        ("save-to-db", "Store the CSV candles from --data in --db under --instrument")
        ("capital,c", po::value<double>(), "Initial capital (default: 10000)")
        ("config", po::value<std::string>(), "Run config JSON file")
        ("results,o", po::value<std::string>(), "Write results JSON to this file")
        ("print-ast", "Print the compiled strategy AST as JSON")
        ("log-level", po::value<std::string>(), "Console log level: trace, debug, info, warn, error");

    // Main try block for exception handling
    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help") || argc == 1) {
            printUsage(desc);
            return 0;
        }

        // --- Configuration ---
        core::RunConfig config;
        if (vm.count("config")) {
            config = core::RunConfig::fromFile(vm["config"].as<std::string>());
        }
        applyOverrides(vm, config);
        config.validate();

        // --- Initialize Logging ---
        core::logging::initialize(config.log_file,
                                  core::logging::level_from_string(config.log_level),
                                  spdlog::level::debug);
        logger = core::logging::getLogger(); // Assign the initialized logger
        logger->info("quantdsl starting...");

        if (config.strategy_file.empty() == config.ir_file.empty()) {
            throw core::ConfigException("Specify exactly one of --strategy or --ir.");
        }
        if (config.data.path.empty()) {
            throw core::ConfigException("No price data: use --data FILE or --db FILE --instrument KEY.");
        }

        // --- Price Data ---
        core::PriceTable prices;
        if (config.data.source == core::DataSource::Csv) {
            prices = data::CsvLoader::load(config.data.path);
            if (vm.count("save-to-db")) {
                if (!vm.count("db")) {
                    throw core::ConfigException("--save-to-db requires --db.");
                }
                saveToDatabase(prices, vm["db"].as<std::string>(), config.data);
            }
        } else {
            prices = loadFromDatabase(config.data);
        }
        logger->info("Price table: {} bars from {} to {}", prices.size(),
                     core::utils::timestampToDate(prices.front().timestamp),
                     core::utils::timestampToDate(prices.back().timestamp));

        // --- Compile, Evaluate, Backtest ---
        backtester::PipelineResult result;
        if (!config.strategy_file.empty()) {
            logger->info("Loading strategy DSL from: {}", config.strategy_file);
            result = backtester::Pipeline::runFromDsl(readTextFile(config.strategy_file, "strategy"),
                                                      prices, config.initial_capital);
        } else {
            logger->info("Loading strategy IR from: {}", config.ir_file);
            result = backtester::Pipeline::runFromJson(readJsonFile(config.ir_file, "IR"),
                                                       prices, config.initial_capital);
        }

        if (vm.count("print-ast")) {
            std::cout << strategy_engine::toJson(result.strategy).dump(2) << "\n\n";
        }

        result.backtest.metrics.logMetrics();
        std::cout << backtester::formatReport(result.backtest);

        if (!config.results_file.empty()) {
            json output = backtester::toJson(result.backtest);
            output["dsl"] = result.dsl_text;
            output["indicators"] = result.indicator_keys;
            output["entry_signal_count"] = result.entry_signal_count;
            output["exit_signal_count"] = result.exit_signal_count;

            std::ofstream ofs(config.results_file);
            if (!ofs.is_open()) {
                throw core::ConfigException(fmt::format("Cannot write results file: {}", config.results_file));
            }
            ofs << output.dump(2) << std::endl;
            logger->info("Results written to {}", config.results_file);
        }

        logger->info("quantdsl finished.");

    // --- Exception Handling ---
    } catch (const po::error& ex) {
        std::cerr << "Usage Error: " << ex.what() << "\n\n";
        printUsage(desc);
        return 1;
    } catch (const core::QuantDslException& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    // Success
    return 0;
}
