/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with the standard console/file configuration used by
 * applications embedding the domain kernel.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace kernel::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    static constexpr std::size_t MAX_FILE_SIZE = 1024 * 1024 * 10;  // 10MB
    static constexpr std::size_t MAX_FILES = 3;

    /**
     * @brief Map a level name to spdlog level
     * @param logLevel trace, debug, info, warn, error, critical
     * @return Matching level, info for unknown names
     */
    static spdlog::level::level_enum parseLevel(const std::string& logLevel) {
        if (logLevel == "trace") {
            return spdlog::level::trace;
        } else if (logLevel == "debug") {
            return spdlog::level::debug;
        } else if (logLevel == "info") {
            return spdlog::level::info;
        } else if (logLevel == "warn") {
            return spdlog::level::warn;
        } else if (logLevel == "error") {
            return spdlog::level::err;
        } else if (logLevel == "critical") {
            return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    /**
     * @brief Initialize the default logger
     * @param loggerName Logger name shown in every line
     * @param logLevel Log level (trace, debug, info, warn, error, critical)
     * @param logToFile Enable file logging
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& loggerName,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, MAX_FILE_SIZE, MAX_FILES);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::info("Logger initialized: name={}, level={}, file={}",
                         loggerName, logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Initialize from KERNEL_LOG_* settings of ConfigManager
     */
    static void initializeFromConfig(const std::string& loggerName);

    /**
     * @brief Set log level at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
        spdlog::info("Log level changed to: {}", level);
    }

    /**
     * @brief Flush the default logger
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace kernel::common
