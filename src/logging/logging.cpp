/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <algorithm>

#include <spdlog/sinks/sink.h>

namespace teardown::logging {

auto initializeLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    auto sinks = SinkFactory::createSinks(config);

    auto logger = std::make_shared<spdlog::logger>(
        std::string(DEFAULT_LOGGER_NAME), sinks.begin(), sinks.end());

    // The logger passes everything its most verbose sink accepts
    auto level = spdlog::level::off;
    for (const auto& sink : sinks) {
        level = std::min(level, sink->level());
    }
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(std::string(DEFAULT_LOGGER_NAME));
    spdlog::set_default_logger(logger);

    spdlog::info("Logging initialized with {} sinks", sinks.size());
    return logger;
}

void shutdownLogging() {
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
    spdlog::shutdown();
}

}  // namespace teardown::logging
