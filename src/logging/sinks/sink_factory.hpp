/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Factory for creating spdlog sinks from configuration

**************************************************/

#ifndef TEARDOWN_LOGGING_SINKS_SINK_FACTORY_HPP
#define TEARDOWN_LOGGING_SINKS_SINK_FACTORY_HPP

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace teardown::logging {

/**
 * @brief Factory class for creating spdlog sinks
 *
 * Supports creating various sink types:
 * - Console (stdout, optionally colored)
 * - Basic file
 * - Rotating file
 * - Daily file
 */
class SinkFactory {
public:
    /**
     * @brief Create every sink the logging section enables
     *
     * The file sink is rotating by default and daily when useDailyRotation is
     * set. Sink creation failures propagate as spdlog::spdlog_ex.
     */
    [[nodiscard]] static auto createSinks(const config::LoggingConfig& config)
        -> std::vector<spdlog::sink_ptr>;

    [[nodiscard]] static auto createConsoleSink(
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "", bool color = true)
        -> spdlog::sink_ptr;

    /**
     * @brief Create a basic file sink
     * @param file_path Path to log file
     * @param truncate Whether to truncate existing file
     */
    [[nodiscard]] static auto createFileSink(
        const std::string& file_path,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "", bool truncate = true)
        -> spdlog::sink_ptr;

    /**
     * @brief Create a rotating file sink
     * @param max_size Maximum file size before rotation
     * @param max_files Maximum number of rotated files to keep
     */
    [[nodiscard]] static auto createRotatingFileSink(
        const std::string& file_path, size_t max_size, size_t max_files,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

    [[nodiscard]] static auto createDailyFileSink(
        const std::string& file_path, int rotation_hour, int rotation_minute,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

    [[nodiscard]] static auto toSpdlogLevel(config::LogLevel level)
        -> spdlog::level::level_enum;

private:
    static void ensureDirectoryExists(const std::string& file_path);
};

}  // namespace teardown::logging

#endif  // TEARDOWN_LOGGING_SINKS_SINK_FACTORY_HPP
