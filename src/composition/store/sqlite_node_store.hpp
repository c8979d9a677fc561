// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_STORE_SQLITE_NODE_STORE_HPP
#define TEARDOWN_COMPOSITION_STORE_SQLITE_NODE_STORE_HPP

#include <memory>

#include "database/database.hpp"
#include "node_store.hpp"

namespace teardown::composition {

/**
 * @brief SQLite implementation of the node store
 *
 * Parent/child links are the parent_id column; siblings keep their insertion
 * order in a position column. Subtrees are loaded with recursive CTEs, and
 * the unbounded form deduplicates ids so it also terminates on corrupt,
 * cyclic data.
 *
 * @note Not synchronized. Share one connection per thread of work.
 */
class SqliteNodeStore : public INodeStore {
public:
    /**
     * @throws DatabaseOpenError, SqlExecutionError if the schema cannot be
     * created
     */
    explicit SqliteNodeStore(std::shared_ptr<database::core::Database> db);

    ~SqliteNodeStore() override = default;

    [[nodiscard]] auto beginTransaction()
        -> std::unique_ptr<StoreTransaction> override;

    [[nodiscard]] auto get(NodeId id)
        -> std::optional<CompositionNode> override;
    [[nodiscard]] auto exists(NodeId id) -> bool override;
    [[nodiscard]] auto getChildren(NodeId id)
        -> std::vector<CompositionNode> override;
    [[nodiscard]] auto getMany(std::span<const NodeId> ids)
        -> std::vector<CompositionNode> override;
    [[nodiscard]] auto fetchForest(const RootSelector& selector,
                                   std::optional<int> maxDepth)
        -> NodeIndex override;
    [[nodiscard]] auto listRootIds() -> std::vector<NodeId> override;
    [[nodiscard]] auto listBrands() -> std::vector<std::string> override;

    [[nodiscard]] auto insert(const CompositionNode& node) -> NodeId override;
    void updateNode(const CompositionNode& node) override;
    void insertMaterialLine(NodeId nodeId, const MaterialLine& line) override;
    void updateMaterialLine(NodeId nodeId, const MaterialLine& line) override;
    void deleteMaterialLines(NodeId nodeId,
                             std::span<const MaterialId> ids) override;
    void setPhysicalProperties(NodeId nodeId,
                               const PhysicalProperties& props) override;
    auto deletePhysicalProperties(NodeId nodeId) -> bool override;
    void insertVideo(NodeId nodeId, const VideoLink& video) override;
    auto deleteSubtree(NodeId id) -> std::vector<NodeId> override;

    [[nodiscard]] auto database() const noexcept
        -> const std::shared_ptr<database::core::Database>& {
        return db_;
    }

private:
    auto readNode(database::core::Statement& stmt) const -> CompositionNode;
    auto loadChildIds(NodeId id) -> std::vector<NodeId>;
    auto loadMaterials(NodeId id) -> std::vector<MaterialLine>;
    auto loadPhysicalProperties(NodeId id) -> std::optional<PhysicalProperties>;
    auto loadVideos(NodeId id) -> std::vector<VideoLink>;
    auto subtreeIds(NodeId id) -> std::vector<NodeId>;

    std::shared_ptr<database::core::Database> db_;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_STORE_SQLITE_NODE_STORE_HPP
