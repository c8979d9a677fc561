// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_QUERY_SUBTREE_QUERY_SERVICE_HPP
#define TEARDOWN_COMPOSITION_QUERY_SUBTREE_QUERY_SERVICE_HPP

#include "../model/node_index.hpp"
#include "../model/tree_view.hpp"
#include "../store/node_store.hpp"
#include "config/sections/composition_config.hpp"

namespace teardown::composition {

/**
 * @brief Depth-bounded read of composition trees
 */
class SubtreeQueryService {
public:
    explicit SubtreeQueryService(
        INodeStore& store,
        int maxDepthLimit = config::CompositionConfig::DEPTH_LIMIT);

    /**
     * @brief Trees under @p selector with at most @p maxDepth levels of
     * components populated
     *
     * @throws atom::error::InvalidArgument if @p maxDepth is outside
     * 1..maxDepthLimit
     * @throws NotFoundError if a selected node does not exist
     */
    [[nodiscard]] auto getSubtree(const RootSelector& selector, int maxDepth)
        -> TreeView;

    /**
     * @brief Project a loaded forest, truncating children at @p maxDepth
     */
    [[nodiscard]] static auto buildView(const NodeIndex& index, int maxDepth)
        -> TreeView;

    [[nodiscard]] auto maxDepthLimit() const noexcept -> int {
        return maxDepthLimit_;
    }

private:
    INodeStore& store_;
    int maxDepthLimit_;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_QUERY_SUBTREE_QUERY_SERVICE_HPP
