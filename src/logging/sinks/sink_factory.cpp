/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace teardown::logging {

auto SinkFactory::createSinks(const config::LoggingConfig& config)
    -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enableConsole) {
        sinks.push_back(createConsoleSink(
            toSpdlogLevel(config::logLevelFromString(config.consoleLevel)),
            config.pattern, config.consoleColor));
    }

    if (config.enableFile) {
        auto fileLevel =
            toSpdlogLevel(config::logLevelFromString(config.fileLevel));
        auto path = (std::filesystem::path(config.logDir) /
                     (config.logFilename + ".log"))
                        .string();
        if (config.useDailyRotation) {
            sinks.push_back(createDailyFileSink(path, config.rotationHour,
                                                config.rotationMinute,
                                                fileLevel, config.pattern));
        } else {
            sinks.push_back(createRotatingFileSink(path, config.maxFileSize,
                                                   config.maxFiles, fileLevel,
                                                   config.pattern));
        }
    }

    return sinks;
}

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    const std::string& pattern, bool color)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (color) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createFileSink(const std::string& file_path,
                                 spdlog::level::level_enum level,
                                 const std::string& pattern, bool truncate)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path,
                                                                    truncate);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createRotatingFileSink(const std::string& file_path,
                                         size_t max_size, size_t max_files,
                                         spdlog::level::level_enum level,
                                         const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file_path, max_size, max_files);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createDailyFileSink(const std::string& file_path,
                                      int rotation_hour, int rotation_minute,
                                      spdlog::level::level_enum level,
                                      const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
        file_path, rotation_hour, rotation_minute);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::toSpdlogLevel(config::LogLevel level)
    -> spdlog::level::level_enum {
    switch (level) {
        case config::LogLevel::Trace: return spdlog::level::trace;
        case config::LogLevel::Debug: return spdlog::level::debug;
        case config::LogLevel::Info: return spdlog::level::info;
        case config::LogLevel::Warn: return spdlog::level::warn;
        case config::LogLevel::Error: return spdlog::level::err;
        case config::LogLevel::Critical: return spdlog::level::critical;
        case config::LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

void SinkFactory::ensureDirectoryExists(const std::string& file_path) {
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

}  // namespace teardown::logging
