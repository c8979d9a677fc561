/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: Loads the teardown configuration document

**************************************************/

#ifndef TEARDOWN_CONFIG_CONFIG_LOADER_HPP
#define TEARDOWN_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>
#include <string_view>

#include "core/exception.hpp"
#include "sections/sections.hpp"

namespace teardown::config {

namespace fs = std::filesystem;

/**
 * @brief Reads `{"teardown": {"store": ..., "composition": ...,
 * "logging": ...}}` documents into typed sections.
 *
 * Missing sections and keys keep their defaults.
 */
class ConfigLoader {
public:
    /**
     * @throws BadConfigException if the text is not JSON or a section has
     * the wrong shape
     * @throws InvalidConfigException if a value is out of range
     */
    [[nodiscard]] static auto fromString(std::string_view text)
        -> TeardownConfig;

    /**
     * @throws ConfigIOException if the file cannot be read
     * @throws BadConfigException, InvalidConfigException as fromString
     */
    [[nodiscard]] static auto fromFile(const fs::path& path) -> TeardownConfig;

    [[nodiscard]] static auto fromJson(const json& document) -> TeardownConfig;

    [[nodiscard]] static auto toJson(const TeardownConfig& config) -> json;
};

}  // namespace teardown::config

#endif  // TEARDOWN_CONFIG_CONFIG_LOADER_HPP
