/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Process-wide logger setup

**************************************************/

#ifndef TEARDOWN_LOGGING_LOGGING_HPP
#define TEARDOWN_LOGGING_LOGGING_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"
#include "sinks/sink_factory.hpp"

namespace teardown::logging {

inline constexpr std::string_view DEFAULT_LOGGER_NAME = "teardown";

/**
 * @brief Builds the sinks described by @p config and installs a logger named
 * "teardown" as the spdlog default logger.
 *
 * Calling it again replaces the previous default logger. Warnings and above
 * are flushed immediately.
 *
 * @return The installed logger
 */
auto initializeLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Flushes and drops every registered logger.
 */
void shutdownLogging();

}  // namespace teardown::logging

#endif  // TEARDOWN_LOGGING_LOGGING_HPP
