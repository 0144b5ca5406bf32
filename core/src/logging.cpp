#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/fmt/chrono.h>  // For {:%Y%m%d} formatting of std::tm
#include <algorithm>    // For std::min
#include <chrono>
#include <cstdlib>      // For std::getenv
#include <ctime>
#include <filesystem>   // For creating the log directory (C++17)
#include <iostream>
#include <map>
#include <memory>
#include <vector>

namespace core {
namespace logging {

    namespace {

        std::shared_ptr<spdlog::logger> global_logger;

        const char* const kLoggerName = "quantdsl";
        const char* const kLogPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";
        const char* const kLogDirectory = "logs";
        constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;   // 10 MB per file
        constexpr std::size_t kMaxFiles = 5;

        // logs/<base>_YYYYMMDD_HHMMSSZ.log, falling back to the working
        // directory when logs/ cannot be created.
        std::string makeLogFilePath(const std::string& base_name) {
            std::filesystem::path dir(kLogDirectory);
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                std::cerr << "[Logging] Cannot create log directory '" << dir.string() << "': "
                          << ec.message() << ". Writing logs to the working directory." << std::endl;
                dir = ".";
            }

            const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm{};
            #ifdef _WIN32
                gmtime_s(&utc_tm, &now);
            #else
                gmtime_r(&now, &utc_tm);
            #endif
            return (dir / fmt::format("{}_{:%Y%m%d_%H%M%S}Z.log", base_name, utc_tm)).string();
        }

        // Replaces the process-wide logger and makes it spdlog's default.
        void install(const std::vector<spdlog::sink_ptr>& sinks, spdlog::level::level_enum level) {
            if (global_logger) {
                spdlog::drop(global_logger->name());
            }
            global_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            global_logger->set_level(level);
            spdlog::register_logger(global_logger);
            spdlog::set_default_logger(global_logger);
        }

    } // namespace

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level)
    {
        // --- Environment override ---
        if (const char* env_level = std::getenv("SPDLOG_LEVEL")) {
            console_level = level_from_string(env_level);
            file_level = console_level;
            std::cout << "[Logging] Overriding log level from SPDLOG_LEVEL environment variable to: "
                      << env_level << std::endl;
        }

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(console_level);
        console_sink->set_pattern(kLogPattern);

        // --- File sink (optional: a run without one still logs to the console) ---
        const std::string log_file_path = makeLogFilePath(base_log_filename);
        std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink;
        std::string file_error;
        try {
            file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, kMaxFileSize, kMaxFiles, true);
            file_sink->set_level(file_level);
            file_sink->set_pattern(kLogPattern);
        } catch (const spdlog::spdlog_ex& ex) {
            file_error = ex.what();
        }

        if (file_sink) {
            install({console_sink, file_sink}, std::min(console_level, file_level));
        } else {
            install({console_sink}, console_level);
        }
        spdlog::flush_on(spdlog::level::err);

        #ifdef NDEBUG
            const char* build_type = "Release";
        #else
            const char* build_type = "Debug";
        #endif

        if (file_sink) {
            global_logger->info("Logging initialized ({} build). Console: {}, File: {} -> {}",
                                build_type,
                                spdlog::level::to_string_view(console_level),
                                spdlog::level::to_string_view(file_level),
                                log_file_path);
        } else {
            global_logger->warn("File logging disabled, cannot open {}: {}", log_file_path, file_error);
        }
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
            // Library or test use without initialize(): console only, quiet.
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern(kLogPattern);
            global_logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
            global_logger->set_level(spdlog::level::warn);
        }
        return global_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        static const std::map<std::string, spdlog::level::level_enum> levels = {
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"warning", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"err", spdlog::level::err},
            {"critical", spdlog::level::critical},
            {"crit", spdlog::level::critical},
            {"off", spdlog::level::off},
        };
        auto it = levels.find(utils::toLower(utils::trim(level_str)));
        if (it != levels.end()) {
            return it->second;
        }
        std::cerr << "[Logging] Unrecognized log level string: '" << level_str << "'. Defaulting to 'info'." << std::endl;
        return spdlog::level::info;
    }

} // namespace logging
} // namespace core
