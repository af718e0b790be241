/**
 * @file logger.h
 * @brief Process-wide spdlog configuration
 *
 * Color console sink plus an optional rotating file sink, installed as the
 * spdlog default logger so every module logs through spdlog::info() etc.
 *
 * @author SmartCore Inc.
 * @date 2026-02-04
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace common {

class Logger {
public:
    static constexpr const char* PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
    static constexpr size_t MAX_FILE_SIZE = 1024 * 1024 * 10;  // 10MB
    static constexpr size_t MAX_FILES = 5;

    /**
     * @brief Map a level name to spdlog; unknown names fall back to info
     */
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn" || level == "warning") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }

    /**
     * @param serviceName Logger name
     * @param logLevel trace, debug, info, warn, error, critical, off
     * @param logFile Rotating log file path; empty disables file logging
     * @return false if the file sink could not be opened (console logging still active)
     */
    static bool initialize(const std::string& serviceName,
                           const std::string& logLevel = "info",
                           const std::string& logFile = "") {
        std::vector<spdlog::sink_ptr> sinks;

        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern(PATTERN);
        sinks.push_back(consoleSink);

        bool fileOk = true;
        if (!logFile.empty()) {
            try {
                std::filesystem::path parent = std::filesystem::path(logFile).parent_path();
                if (!parent.empty()) {
                    std::filesystem::create_directories(parent);
                }
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, MAX_FILE_SIZE, MAX_FILES);
                fileSink->set_pattern(PATTERN);
                sinks.push_back(fileSink);
            } catch (const std::exception& ex) {
                std::cerr << "File logging disabled (" << logFile << "): " << ex.what() << std::endl;
                fileOk = false;
            }
        }

        auto logger = std::make_shared<spdlog::logger>(serviceName, sinks.begin(), sinks.end());
        logger->set_level(parseLevel(logLevel));

        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);

        spdlog::info("Logger initialized: service={}, level={}, file={}",
                     serviceName, logLevel, (logFile.empty() || !fileOk) ? "none" : logFile);
        return fileOk;
    }

    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
        spdlog::info("Log level changed to: {}", level);
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace common
