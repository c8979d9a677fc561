// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_MODEL_TREE_DEFINITION_HPP
#define TEARDOWN_COMPOSITION_MODEL_TREE_DEFINITION_HPP

#include <optional>
#include <vector>

#include "types.hpp"

namespace teardown::composition {

/**
 * @brief A candidate tree submitted for creation
 *
 * Children are nested by value. A node may carry a declared id, the identity
 * it had where it was exported from; declared ids only take part in cycle
 * detection and are never used as storage ids.
 *
 * @code
 * TreeDefinition chair;
 * chair.details.name = "Chair";
 *
 * TreeDefinition seat;
 * seat.details.name = "Seat";
 * seat.amountInParent = 2.0;
 * seat.billOfMaterials.push_back({steelId, 1.5, Unit::Kilogram});
 *
 * chair.components.push_back(seat);
 * @endcode
 */
struct TreeDefinition {
    std::optional<NodeId> declaredId;
    NodeDetails details;
    std::optional<double> amountInParent;
    std::optional<ProductTypeId> productTypeId;
    std::vector<MaterialLine> billOfMaterials;
    std::optional<PhysicalProperties> physicalProperties;
    std::vector<VideoLink> videos;
    std::vector<TreeDefinition> components;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Parse a nested definition
     *
     * Only the shape is checked here; structural rules are enforced by
     * TreeInvariantValidator.
     */
    static auto fromJson(const nlohmann::json& j)
        -> std::expected<TreeDefinition, std::string>;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_MODEL_TREE_DEFINITION_HPP
