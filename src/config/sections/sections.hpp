/*
 * sections.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Aggregated header for all configuration sections

**************************************************/

#ifndef TEARDOWN_CONFIG_SECTIONS_HPP
#define TEARDOWN_CONFIG_SECTIONS_HPP

#include "composition_config.hpp"
#include "logging_config.hpp"
#include "store_config.hpp"

namespace teardown::config {

/**
 * @brief Every section of one configuration document
 */
struct TeardownConfig {
    StoreConfig store;
    CompositionConfig composition;
    LoggingConfig logging;
};

}  // namespace teardown::config

#endif  // TEARDOWN_CONFIG_SECTIONS_HPP
