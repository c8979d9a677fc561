// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_MODEL_TREE_VIEW_HPP
#define TEARDOWN_COMPOSITION_MODEL_TREE_VIEW_HPP

#include <optional>
#include <vector>

#include "types.hpp"

namespace teardown::composition {

/**
 * @brief Read-side projection of a node with its children nested to a
 * bounded depth. Children past the bound are left empty.
 */
struct NodeView {
    NodeId id = 0;
    std::optional<NodeId> parentId;
    std::optional<double> amountInParent;
    OwnerId ownerId;
    std::optional<ProductTypeId> productTypeId;
    NodeDetails details;
    std::vector<MaterialLine> billOfMaterials;
    std::vector<NodeView> components;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

struct TreeView {
    std::vector<NodeView> roots;
    int maxDepth = 1;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_MODEL_TREE_VIEW_HPP
