// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_MODEL_TYPES_HPP
#define TEARDOWN_COMPOSITION_MODEL_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json_fwd.hpp>

#include "units.hpp"

namespace teardown::composition {

using NodeId = int64_t;
using OwnerId = std::string;
using ProductTypeId = int64_t;
using MaterialId = int64_t;

/// Second resolution, stored as epoch seconds
using Timestamp = std::chrono::sys_seconds;

[[nodiscard]] inline auto nowTimestamp() -> Timestamp {
    return std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now());
}

/**
 * @brief Selects every node without a parent
 */
struct AllRoots {
    bool operator==(const AllRoots&) const = default;
};

using RootSelector = std::variant<NodeId, AllRoots>;

/**
 * @brief One bill-of-materials line: how much of a material a single unit
 * of the node consumes directly
 */
struct MaterialLine {
    MaterialId materialId = 0;
    double quantity = 0.0;
    Unit unit = Unit::Kilogram;

    bool operator==(const MaterialLine&) const = default;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    static auto fromJson(const nlohmann::json& j)
        -> std::expected<MaterialLine, std::string>;
};

/**
 * @brief Measured physical properties. Every value is optional and must be
 * positive when present.
 */
struct PhysicalProperties {
    std::optional<double> weightKg;
    std::optional<double> heightCm;
    std::optional<double> widthCm;
    std::optional<double> depthCm;

    /**
     * @brief Bounding volume, available once all three dimensions are known
     */
    [[nodiscard]] auto volumeCm3() const -> std::optional<double> {
        if (heightCm && widthCm && depthCm) {
            return *heightCm * *widthCm * *depthCm;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto empty() const -> bool {
        return !weightKg && !heightCm && !widthCm && !depthCm;
    }

    bool operator==(const PhysicalProperties&) const = default;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    static auto fromJson(const nlohmann::json& j)
        -> std::expected<PhysicalProperties, std::string>;
};

/**
 * @brief Link to a recording of the disassembly
 */
struct VideoLink {
    std::string url;
    std::string title;
    std::optional<std::string> description;

    bool operator==(const VideoLink&) const = default;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    static auto fromJson(const nlohmann::json& j)
        -> std::expected<VideoLink, std::string>;
};

/**
 * @brief Descriptive fields shared by candidate and stored nodes
 */
struct NodeDetails {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> brand;
    std::optional<std::string> model;
    std::optional<std::string> dismantlingNotes;
    /// Defaults to the creation time when absent
    std::optional<Timestamp> dismantlingTimeStart;
    std::optional<Timestamp> dismantlingTimeEnd;

    bool operator==(const NodeDetails&) const = default;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    static auto fromJson(const nlohmann::json& j)
        -> std::expected<NodeDetails, std::string>;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_MODEL_TYPES_HPP
