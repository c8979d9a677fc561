/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_loader.hpp"

#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>

namespace teardown::config {

namespace {

template <typename Section>
auto readSection(const json& root) -> Section {
    const std::string key(Section::key());
    if (!root.contains(key)) {
        return Section::defaults();
    }
    const auto& node = root.at(key);
    if (!node.is_object()) {
        THROW_BAD_CONFIG_EXCEPTION("Section '" + std::string(Section::PATH) +
                                   "' must be an object");
    }
    try {
        return Section::fromJson(node);
    } catch (const json::exception& e) {
        THROW_BAD_CONFIG_EXCEPTION("Section '" + std::string(Section::PATH) +
                                   "': " + e.what());
    }
}

}  // namespace

auto ConfigLoader::fromJson(const json& document) -> TeardownConfig {
    if (!document.is_object()) {
        THROW_BAD_CONFIG_EXCEPTION("Configuration document must be an object");
    }

    TeardownConfig config;
    if (!document.contains("teardown")) {
        spdlog::warn("Configuration has no 'teardown' object, using defaults");
        return config;
    }

    const auto& root = document.at("teardown");
    if (!root.is_object()) {
        THROW_BAD_CONFIG_EXCEPTION("'teardown' must be an object");
    }

    config.store = readSection<StoreConfig>(root);
    config.composition = readSection<CompositionConfig>(root);
    config.logging = readSection<LoggingConfig>(root);
    return config;
}

auto ConfigLoader::fromString(std::string_view text) -> TeardownConfig {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to parse configuration: {}", e.what());
        THROW_BAD_CONFIG_EXCEPTION(std::string("Malformed configuration: ") +
                                   e.what());
    }
    return fromJson(document);
}

auto ConfigLoader::fromFile(const fs::path& path) -> TeardownConfig {
    std::ifstream ifs(path);
    if (!ifs) {
        spdlog::error("Failed to open config file: {}", path.string());
        THROW_CONFIG_IO_EXCEPTION("Cannot open config file: " + path.string());
    }

    std::string text((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        THROW_CONFIG_IO_EXCEPTION("Failed reading config file: " +
                                  path.string());
    }

    auto config = fromString(text);
    spdlog::info("Config loaded from file: {}", path.string());
    return config;
}

auto ConfigLoader::toJson(const TeardownConfig& config) -> json {
    json root = json::object();
    root[std::string(StoreConfig::key())] = config.store.toJson();
    root[std::string(CompositionConfig::key())] = config.composition.toJson();
    root[std::string(LoggingConfig::key())] = config.logging.toJson();
    return {{"teardown", root}};
}

}  // namespace teardown::config
