/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef TEARDOWN_CONFIG_CORE_CONFIG_SECTION_HPP
#define TEARDOWN_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace teardown::config {

using json = nlohmann::json;

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr PATH member for the configuration path
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&) to create from JSON; missing
 *    keys keep their defaults, out-of-range values throw
 *    InvalidConfigException
 * 4. Implement static generateSchema() to return JSON Schema
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 *
 * @example
 * ```cpp
 * struct StoreConfig : ConfigSection<StoreConfig> {
 *     static constexpr std::string_view PATH = "/teardown/store";
 *
 *     std::string databasePath = "teardown.db";
 *
 *     [[nodiscard]] json serialize() const {
 *         return {{"databasePath", databasePath}};
 *     }
 *
 *     [[nodiscard]] static StoreConfig deserialize(const json& j) {
 *         StoreConfig config;
 *         config.databasePath = j.value("databasePath", config.databasePath);
 *         return config;
 *     }
 *
 *     [[nodiscard]] static json generateSchema() {
 *         json schema;
 *         schema["type"] = "object";
 *         schema["properties"]["databasePath"] = {{"type", "string"}};
 *         return schema;
 *     }
 * };
 * ```
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the configuration path for this section
     * @return Configuration path (e.g., "/teardown/store")
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    /**
     * @brief Last component of PATH, the key of this section inside the
     * "teardown" object of a configuration document
     */
    [[nodiscard]] static constexpr std::string_view key() noexcept {
        constexpr std::string_view p = Derived::PATH;
        return p.substr(p.rfind('/') + 1);
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Merge another configuration into this one
     *
     * Values from other override values in this config. Null values are
     * skipped.
     */
    void merge(const Derived& other) {
        auto thisJson = toJson();
        mergeJson(thisJson, other.toJson());
        *static_cast<Derived*>(this) = Derived::deserialize(thisJson);
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }

private:
    static void mergeJson(json& target, const json& source) {
        if (!source.is_object()) {
            return;
        }
        for (auto& [key, value] : source.items()) {
            if (value.is_object() && target.contains(key) &&
                target[key].is_object()) {
                mergeJson(target[key], value);
            } else if (!value.is_null()) {
                target[key] = value;
            }
        }
    }
};

}  // namespace teardown::config

#endif  // TEARDOWN_CONFIG_CORE_CONFIG_SECTION_HPP
