// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_STORE_NODE_STORE_HPP
#define TEARDOWN_COMPOSITION_STORE_NODE_STORE_HPP

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "../model/composition_node.hpp"
#include "../model/node_index.hpp"

namespace teardown::composition {

/**
 * @brief Handle on an open store transaction
 *
 * Destroying a handle that was neither committed nor rolled back rolls the
 * transaction back.
 */
class StoreTransaction {
public:
    virtual ~StoreTransaction() = default;

    /**
     * @throws IntegrityError if a constraint rejects the transaction at
     * commit time
     */
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

/**
 * @brief Persistence of composition nodes and the rows they own
 *
 * Writes made between beginTransaction() and commit() become visible
 * together. Ids are assigned by insert() inside the open transaction.
 * Constraint failures surface as IntegrityError.
 */
class INodeStore {
public:
    virtual ~INodeStore() = default;

    // ==================== Transactions ====================

    [[nodiscard]] virtual auto beginTransaction()
        -> std::unique_ptr<StoreTransaction> = 0;

    // ==================== Reads ====================

    /**
     * @brief One node with its materials, child ids, physical properties and
     * videos
     */
    [[nodiscard]] virtual auto get(NodeId id)
        -> std::optional<CompositionNode> = 0;

    [[nodiscard]] virtual auto exists(NodeId id) -> bool = 0;

    /**
     * @brief Direct children of @p id, in insertion order
     */
    [[nodiscard]] virtual auto getChildren(NodeId id)
        -> std::vector<CompositionNode> = 0;

    /**
     * @brief Nodes for the ids that exist; missing ids are skipped
     */
    [[nodiscard]] virtual auto getMany(std::span<const NodeId> ids)
        -> std::vector<CompositionNode> = 0;

    /**
     * @brief Bulk load of the forest under @p selector
     *
     * With @p maxDepth set, levels 0..maxDepth are loaded; otherwise the
     * whole subtree. Nodes carry their materials and the ids of their loaded
     * children, not physical properties or videos. A node reachable twice
     * (corrupt data) is loaded once.
     */
    [[nodiscard]] virtual auto fetchForest(const RootSelector& selector,
                                           std::optional<int> maxDepth)
        -> NodeIndex = 0;

    [[nodiscard]] virtual auto listRootIds() -> std::vector<NodeId> = 0;

    /**
     * @brief Distinct non-empty brands as stored
     */
    [[nodiscard]] virtual auto listBrands() -> std::vector<std::string> = 0;

    // ==================== Writes ====================

    /**
     * @brief Insert the node's own row and return its new id
     *
     * `id`, `createdAt` and `updatedAt` of @p node are ignored. Owned rows
     * (materials, properties, videos) are written with their own calls.
     */
    [[nodiscard]] virtual auto insert(const CompositionNode& node)
        -> NodeId = 0;

    /**
     * @brief Overwrite the scalar columns of an existing node
     */
    virtual void updateNode(const CompositionNode& node) = 0;

    virtual void insertMaterialLine(NodeId nodeId,
                                    const MaterialLine& line) = 0;
    virtual void updateMaterialLine(NodeId nodeId,
                                    const MaterialLine& line) = 0;
    virtual void deleteMaterialLines(NodeId nodeId,
                                     std::span<const MaterialId> ids) = 0;

    virtual void setPhysicalProperties(NodeId nodeId,
                                       const PhysicalProperties& props) = 0;

    /**
     * @return false if the node had no properties
     */
    virtual auto deletePhysicalProperties(NodeId nodeId) -> bool = 0;

    virtual void insertVideo(NodeId nodeId, const VideoLink& video) = 0;

    /**
     * @brief Delete @p id, its descendants and every row they own
     * @return Ids of the removed nodes, @p id first
     */
    virtual auto deleteSubtree(NodeId id) -> std::vector<NodeId> = 0;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_STORE_NODE_STORE_HPP
