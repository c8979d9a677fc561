/*
 * composition_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: Composition engine configuration section

**************************************************/

#ifndef TEARDOWN_CONFIG_SECTIONS_COMPOSITION_CONFIG_HPP
#define TEARDOWN_CONFIG_SECTIONS_COMPOSITION_CONFIG_HPP

#include <optional>
#include <string>

#include "../core/config_section.hpp"
#include "../core/exception.hpp"

namespace teardown::config {

/**
 * @brief How the BOM aggregator treats the units of material lines
 */
enum class UnitPolicy {
    Normalize,  ///< Convert to the dimension's base unit before summing
    Reject,     ///< Fail when a material is recorded in more than one unit
    Raw         ///< Sum raw quantities, report the first unit seen
};

[[nodiscard]] inline std::string unitPolicyToString(UnitPolicy policy) {
    switch (policy) {
        case UnitPolicy::Normalize: return "normalize";
        case UnitPolicy::Reject: return "reject";
        case UnitPolicy::Raw: return "raw";
    }
    return "normalize";
}

[[nodiscard]] inline std::optional<UnitPolicy> unitPolicyFromString(
    const std::string& str) {
    if (str == "normalize") return UnitPolicy::Normalize;
    if (str == "reject") return UnitPolicy::Reject;
    if (str == "raw") return UnitPolicy::Raw;
    return std::nullopt;
}

struct CompositionConfig : ConfigSection<CompositionConfig> {
    static constexpr std::string_view PATH = "/teardown/composition";

    /// Hard ceiling for maxSubtreeDepth
    static constexpr int DEPTH_LIMIT = 5;

    int maxSubtreeDepth{DEPTH_LIMIT};
    UnitPolicy unitPolicy{UnitPolicy::Normalize};

    [[nodiscard]] json serialize() const {
        return {{"maxSubtreeDepth", maxSubtreeDepth},
                {"unitPolicy", unitPolicyToString(unitPolicy)}};
    }

    [[nodiscard]] static CompositionConfig deserialize(const json& j) {
        CompositionConfig cfg;
        cfg.maxSubtreeDepth = j.value("maxSubtreeDepth", cfg.maxSubtreeDepth);
        if (cfg.maxSubtreeDepth < 1 || cfg.maxSubtreeDepth > DEPTH_LIMIT) {
            THROW_INVALID_CONFIG_EXCEPTION(
                "composition.maxSubtreeDepth must be within 1.." +
                std::to_string(DEPTH_LIMIT) + ", got " +
                std::to_string(cfg.maxSubtreeDepth));
        }

        auto policyName =
            j.value("unitPolicy", unitPolicyToString(cfg.unitPolicy));
        auto policy = unitPolicyFromString(policyName);
        if (!policy) {
            THROW_INVALID_CONFIG_EXCEPTION(
                "composition.unitPolicy must be normalize, reject or raw, "
                "got '" + policyName + "'");
        }
        cfg.unitPolicy = *policy;
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {{"type", "object"},
                {"properties",
                 {{"maxSubtreeDepth",
                   {{"type", "integer"},
                    {"minimum", 1},
                    {"maximum", DEPTH_LIMIT},
                    {"default", DEPTH_LIMIT}}},
                  {"unitPolicy",
                   {{"type", "string"},
                    {"enum", {"normalize", "reject", "raw"}},
                    {"default", "normalize"}}}}}};
    }
};

}  // namespace teardown::config

#endif  // TEARDOWN_CONFIG_SECTIONS_COMPOSITION_CONFIG_HPP
