/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Provides a consistent logging setup for the fiscid tools.
 * Wraps spdlog with standardized configuration.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    /**
     * @brief Map a level name to spdlog's enum
     * @param logLevel trace, debug, info, warn, error, critical (anything else is info)
     */
    static spdlog::level::level_enum parseLevel(const std::string& logLevel) {
        if (logLevel == "trace") return spdlog::level::trace;
        if (logLevel == "debug") return spdlog::level::debug;
        if (logLevel == "warn") return spdlog::level::warn;
        if (logLevel == "error") return spdlog::level::err;
        if (logLevel == "critical") return spdlog::level::critical;
        if (logLevel == "off") return spdlog::level::off;
        return spdlog::level::info;
    }

    /**
     * @brief Initialize the default logger
     * @param toolName Logger name shown in every line (e.g., "import-checker")
     * @param logLevel Log level (trace, debug, info, warn, error, critical, off)
     * @param logFile Rotating log file path; empty disables the file sink
     * @param useStderr Log to stderr so stdout stays free for the report
     */
    static void initialize(
        const std::string& toolName,
        const std::string& logLevel = "info",
        const std::string& logFile = "",
        bool useStderr = true
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Console sink (colored)
            spdlog::sink_ptr consoleSink;
            if (useStderr) {
                consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            } else {
                consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            }
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            // File sink (if enabled)
            if (!logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3  // 10MB, 3 files
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(toolName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::debug("Logger initialized: tool={}, level={}, file={}",
                          toolName, logLevel, logFile.empty() ? "none" : logFile);

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Flush the default logger
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace common
