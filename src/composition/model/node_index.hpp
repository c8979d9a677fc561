// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_MODEL_NODE_INDEX_HPP
#define TEARDOWN_COMPOSITION_MODEL_NODE_INDEX_HPP

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "composition_node.hpp"

namespace teardown::composition {

/**
 * @brief Arena of stored nodes with an id lookup
 *
 * Nodes refer to each other only through ids, so a forest loaded in bulk
 * can be walked without back-pointers. A node's `components` lists the
 * children that were loaded with it; in a depth-bounded load the nodes on
 * the last level have none.
 */
class NodeIndex {
public:
    /**
     * @brief Add a node, replacing any node with the same id
     */
    void add(CompositionNode node) {
        if (auto it = index_.find(node.id); it != index_.end()) {
            arena_[it->second] = std::move(node);
            return;
        }
        index_.emplace(node.id, arena_.size());
        arena_.push_back(std::move(node));
    }

    /**
     * @brief Record @p id as one of the roots the forest was loaded from
     */
    void addRoot(NodeId id) { roots_.push_back(id); }

    [[nodiscard]] auto find(NodeId id) const -> const CompositionNode* {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &arena_[it->second];
    }

    [[nodiscard]] auto find(NodeId id) -> CompositionNode* {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &arena_[it->second];
    }

    [[nodiscard]] auto contains(NodeId id) const -> bool {
        return index_.contains(id);
    }

    [[nodiscard]] auto size() const noexcept -> size_t { return arena_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return arena_.empty(); }

    [[nodiscard]] auto nodes() const noexcept
        -> const std::vector<CompositionNode>& {
        return arena_;
    }

    [[nodiscard]] auto roots() const noexcept -> const std::vector<NodeId>& {
        return roots_;
    }

private:
    std::vector<CompositionNode> arena_;
    std::unordered_map<NodeId, size_t> index_;
    std::vector<NodeId> roots_;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_MODEL_NODE_INDEX_HPP
