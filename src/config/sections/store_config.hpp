/*
 * store_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: Node store (SQLite) configuration section

**************************************************/

#ifndef TEARDOWN_CONFIG_SECTIONS_STORE_CONFIG_HPP
#define TEARDOWN_CONFIG_SECTIONS_STORE_CONFIG_HPP

#include <string>
#include <unordered_map>

#include "../core/config_section.hpp"
#include "../core/exception.hpp"

namespace teardown::config {

/**
 * @brief Where the composition records live and how the SQLite connection is
 * tuned.
 *
 * `pragmas` are applied after the built-in foreign_keys / journal_mode /
 * synchronous settings, so they may override the latter two.
 */
struct StoreConfig : ConfigSection<StoreConfig> {
    static constexpr std::string_view PATH = "/teardown/store";

    std::string databasePath{"teardown.db"};
    std::unordered_map<std::string, std::string> pragmas;
    int busyTimeoutMs{5000};

    [[nodiscard]] json serialize() const {
        return {{"databasePath", databasePath},
                {"pragmas", pragmas},
                {"busyTimeoutMs", busyTimeoutMs}};
    }

    [[nodiscard]] static StoreConfig deserialize(const json& j) {
        StoreConfig cfg;
        cfg.databasePath = j.value("databasePath", cfg.databasePath);
        cfg.busyTimeoutMs = j.value("busyTimeoutMs", cfg.busyTimeoutMs);
        if (j.contains("pragmas")) {
            for (const auto& [name, value] : j.at("pragmas").items()) {
                cfg.pragmas[name] = value.is_string() ? value.get<std::string>()
                                                      : value.dump();
            }
        }

        if (cfg.databasePath.empty()) {
            THROW_INVALID_CONFIG_EXCEPTION("store.databasePath is empty");
        }
        if (cfg.busyTimeoutMs < 0) {
            THROW_INVALID_CONFIG_EXCEPTION(
                "store.busyTimeoutMs must not be negative");
        }
        if (cfg.pragmas.contains("foreign_keys")) {
            THROW_INVALID_CONFIG_EXCEPTION(
                "store.pragmas may not change foreign_keys");
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {{"type", "object"},
                {"properties",
                 {{"databasePath",
                   {{"type", "string"},
                    {"minLength", 1},
                    {"default", "teardown.db"}}},
                  {"pragmas",
                   {{"type", "object"},
                    {"additionalProperties", {{"type", "string"}}}}},
                  {"busyTimeoutMs",
                   {{"type", "integer"}, {"minimum", 0}, {"default", 5000}}}}}};
    }
};

}  // namespace teardown::config

#endif  // TEARDOWN_CONFIG_SECTIONS_STORE_CONFIG_HPP
