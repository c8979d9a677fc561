/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging configuration section

**************************************************/

#ifndef TEARDOWN_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define TEARDOWN_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"
#include "../core/exception.hpp"

namespace teardown::config {

/**
 * @brief Log level enumeration
 */
enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, Off };

[[nodiscard]] inline std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

/**
 * @brief Convert string to LogLevel, accepting the usual aliases
 * @throws InvalidConfigException for an unknown level name
 */
[[nodiscard]] inline LogLevel logLevelFromString(const std::string& str) {
    if (str == "trace") return LogLevel::Trace;
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warn" || str == "warning") return LogLevel::Warn;
    if (str == "error" || str == "err") return LogLevel::Error;
    if (str == "critical" || str == "fatal") return LogLevel::Critical;
    if (str == "off" || str == "none") return LogLevel::Off;
    THROW_INVALID_CONFIG_EXCEPTION("Unknown log level: " + str);
}

/**
 * @brief Logging configuration
 *
 * @example
 * ```json
 * {
 *   "teardown": {
 *     "logging": {
 *       "enableConsole": true,
 *       "consoleLevel": "info",
 *       "enableFile": true,
 *       "logDir": "logs",
 *       "logFilename": "teardown",
 *       "fileLevel": "debug",
 *       "maxFileSize": 10485760,
 *       "maxFiles": 5
 *     }
 *   }
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "/teardown/logging";

    // Console
    bool enableConsole{true};
    std::string consoleLevel{"info"};
    bool consoleColor{true};

    // File
    bool enableFile{false};
    std::string logDir{"logs"};
    std::string logFilename{"teardown"};  ///< Base filename (without extension)
    std::string fileLevel{"debug"};

    // Rotation
    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size before rotation
    size_t maxFiles{5};
    bool useDailyRotation{false};  ///< Use daily rotation instead of size-based
    int rotationHour{0};
    int rotationMinute{0};

    /// Available placeholders: %Y %m %d %H %M %S %e (milliseconds)
    ///                        %l (level), %n (logger name), %t (thread id)
    ///                        %s (source file), %# (line number), %v (message)
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v"};

    [[nodiscard]] json serialize() const {
        return {{"enableConsole", enableConsole},
                {"consoleLevel", consoleLevel},
                {"consoleColor", consoleColor},
                {"enableFile", enableFile},
                {"logDir", logDir},
                {"logFilename", logFilename},
                {"fileLevel", fileLevel},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"useDailyRotation", useDailyRotation},
                {"rotationHour", rotationHour},
                {"rotationMinute", rotationMinute},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;

        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);

        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);

        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        cfg.useDailyRotation =
            j.value("useDailyRotation", cfg.useDailyRotation);
        cfg.rotationHour = j.value("rotationHour", cfg.rotationHour);
        cfg.rotationMinute = j.value("rotationMinute", cfg.rotationMinute);

        cfg.pattern = j.value("pattern", cfg.pattern);

        // Reject unknown level names up front
        (void)logLevelFromString(cfg.consoleLevel);
        (void)logLevelFromString(cfg.fileLevel);

        if (cfg.maxFiles < 1) {
            THROW_INVALID_CONFIG_EXCEPTION("logging.maxFiles must be >= 1");
        }
        if (cfg.rotationHour < 0 || cfg.rotationHour > 23 ||
            cfg.rotationMinute < 0 || cfg.rotationMinute > 59) {
            THROW_INVALID_CONFIG_EXCEPTION(
                "logging rotation time out of range");
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json levels = {"trace", "debug", "info", "warn",
                       "error", "critical", "off"};
        return {{"type", "object"},
                {"properties",
                 {{"enableConsole", {{"type", "boolean"}, {"default", true}}},
                  {"consoleLevel",
                   {{"type", "string"}, {"enum", levels}, {"default", "info"}}},
                  {"consoleColor", {{"type", "boolean"}, {"default", true}}},
                  {"enableFile", {{"type", "boolean"}, {"default", false}}},
                  {"logDir", {{"type", "string"}, {"default", "logs"}}},
                  {"logFilename",
                   {{"type", "string"}, {"default", "teardown"}}},
                  {"fileLevel",
                   {{"type", "string"}, {"enum", levels}, {"default", "debug"}}},
                  {"maxFileSize",
                   {{"type", "integer"},
                    {"minimum", 1024},
                    {"default", 10485760}}},
                  {"maxFiles",
                   {{"type", "integer"}, {"minimum", 1}, {"default", 5}}},
                  {"useDailyRotation",
                   {{"type", "boolean"}, {"default", false}}},
                  {"rotationHour",
                   {{"type", "integer"}, {"minimum", 0}, {"maximum", 23}}},
                  {"rotationMinute",
                   {{"type", "integer"}, {"minimum", 0}, {"maximum", 59}}},
                  {"pattern", {{"type", "string"}}}}}};
    }
};

}  // namespace teardown::config

#endif  // TEARDOWN_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
