// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include "subtree_query_service.hpp"

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>

#include "../errors.hpp"
#include "atom/error/exception.hpp"

namespace teardown::composition {

namespace {

auto projectNode(const NodeIndex& index, const CompositionNode& node,
                 int depth, int maxDepth) -> NodeView {
    NodeView view;
    view.id = node.id;
    view.parentId = node.parentId;
    view.amountInParent = node.amountInParent;
    view.ownerId = node.ownerId;
    view.productTypeId = node.productTypeId;
    view.details = node.details;
    view.billOfMaterials = node.billOfMaterials;

    if (depth >= maxDepth) {
        return view;
    }
    view.components.reserve(node.components.size());
    for (NodeId childId : node.components) {
        if (const auto* child = index.find(childId)) {
            view.components.push_back(
                projectNode(index, *child, depth + 1, maxDepth));
        }
    }
    return view;
}

}  // namespace

SubtreeQueryService::SubtreeQueryService(INodeStore& store, int maxDepthLimit)
    : store_(store),
      maxDepthLimit_(std::clamp(maxDepthLimit, 1,
                                config::CompositionConfig::DEPTH_LIMIT)) {}

auto SubtreeQueryService::getSubtree(const RootSelector& selector,
                                     int maxDepth) -> TreeView {
    if (maxDepth < 1 || maxDepth > maxDepthLimit_) {
        THROW_INVALID_ARGUMENT("maxDepth must be between 1 and " +
                               std::to_string(maxDepthLimit_) + ", got " +
                               std::to_string(maxDepth));
    }

    auto index = store_.fetchForest(selector, maxDepth);
    if (const auto* rootId = std::get_if<NodeId>(&selector);
        rootId != nullptr && !index.contains(*rootId)) {
        THROW_NOT_FOUND_ERROR(
            notFoundContext("node", std::to_string(*rootId)),
            "Node " + std::to_string(*rootId) + " does not exist");
    }

    auto view = buildView(index, maxDepth);
    SPDLOG_DEBUG("Subtree query returned {} roots from {} nodes",
                 view.roots.size(), index.size());
    return view;
}

auto SubtreeQueryService::buildView(const NodeIndex& index, int maxDepth)
    -> TreeView {
    TreeView view;
    view.maxDepth = maxDepth;
    view.roots.reserve(index.roots().size());
    for (NodeId rootId : index.roots()) {
        if (const auto* root = index.find(rootId)) {
            view.roots.push_back(projectNode(index, *root, 0, maxDepth));
        }
    }
    return view;
}

}  // namespace teardown::composition
