// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_MODEL_COMPOSITION_NODE_HPP
#define TEARDOWN_COMPOSITION_MODEL_COMPOSITION_NODE_HPP

#include <optional>
#include <vector>

#include "types.hpp"

namespace teardown::composition {

/**
 * @brief A stored product or component
 *
 * A node without a parent is a root (a base product) and has no
 * amountInParent; every other node records how many units of it one unit of
 * the parent contains. Children are referenced by id, in insertion order.
 */
struct CompositionNode {
    NodeId id = 0;
    std::optional<NodeId> parentId;
    std::optional<double> amountInParent;
    OwnerId ownerId;
    std::optional<ProductTypeId> productTypeId;

    NodeDetails details;

    std::vector<MaterialLine> billOfMaterials;
    std::vector<NodeId> components;
    std::optional<PhysicalProperties> physicalProperties;
    std::vector<VideoLink> videos;

    Timestamp createdAt{};
    Timestamp updatedAt{};

    [[nodiscard]] auto isRoot() const -> bool { return !parentId.has_value(); }
    [[nodiscard]] auto isLeaf() const -> bool { return components.empty(); }

    [[nodiscard]] auto findMaterial(MaterialId materialId) const
        -> const MaterialLine*;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Scalar changes to one node. Unset members are left alone; an empty
 * string clears an optional text field.
 */
struct NodeUpdate {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> brand;
    std::optional<std::string> model;
    std::optional<std::string> dismantlingNotes;
    std::optional<Timestamp> dismantlingTimeStart;
    std::optional<Timestamp> dismantlingTimeEnd;
    std::optional<ProductTypeId> productTypeId;
    /// Only valid for nodes that have a parent
    std::optional<double> amountInParent;

    [[nodiscard]] auto empty() const -> bool {
        return !name && !description && !brand && !model &&
               !dismantlingNotes && !dismantlingTimeStart &&
               !dismantlingTimeEnd && !productTypeId && !amountInParent;
    }

    static auto fromJson(const nlohmann::json& j)
        -> std::expected<NodeUpdate, std::string>;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_MODEL_COMPOSITION_NODE_HPP
