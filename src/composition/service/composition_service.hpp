// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_SERVICE_COMPOSITION_SERVICE_HPP
#define TEARDOWN_COMPOSITION_SERVICE_COMPOSITION_SERVICE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "../bom/bom_aggregator.hpp"
#include "../builder/composition_builder.hpp"
#include "../query/subtree_query_service.hpp"
#include "config/sections/composition_config.hpp"

namespace teardown::composition {

/**
 * @brief Entry point for composition records
 *
 * Thin orchestration over the builder, the query service and the
 * aggregator, plus the single-node maintenance operations (scalar updates,
 * bill-of-materials lines, physical properties, subtree deletion).
 *
 * @note Each call is independent. Concurrent writers on one tree are not
 * serialized beyond what a single database transaction provides.
 */
class CompositionService {
public:
    /**
     * @brief Called after a subtree deletion has committed, with the removed
     * ids (deleted root first). Failures are logged and otherwise ignored.
     */
    using PostDeleteHook = std::function<void(const std::vector<NodeId>&)>;

    CompositionService(std::shared_ptr<INodeStore> store,
                       std::shared_ptr<IOwnerDirectory> owners,
                       std::shared_ptr<IProductTypeCatalog> productTypes,
                       std::shared_ptr<IMaterialCatalog> materials,
                       config::CompositionConfig settings = {});

    // ==================== Trees ====================

    auto createComposition(const TreeDefinition& definition,
                           const OwnerId& ownerId,
                           std::optional<ProductTypeId> productTypeId =
                               std::nullopt) -> NodeId;

    auto addComponent(NodeId parentId, const TreeDefinition& definition)
        -> NodeId;

    [[nodiscard]] auto getSubtree(const RootSelector& selector, int maxDepth)
        -> TreeView;

    [[nodiscard]] auto aggregateBillOfMaterials(NodeId rootId)
        -> BillOfMaterials;

    /**
     * @brief Delete @p id with its whole subtree
     *
     * @return Removed ids, @p id first
     * @throws NotFoundError if the node does not exist
     * @throws CompositionError if the parent would be left with neither
     * materials nor components
     */
    auto deleteSubtree(NodeId id) -> std::vector<NodeId>;

    /**
     * @brief Re-run every tree check over a stored subtree
     * @throws ValidationError subclasses on the first violation found
     */
    void validateSubtree(NodeId id);

    // ==================== Nodes ====================

    [[nodiscard]] auto getNode(NodeId id) -> CompositionNode;

    /**
     * @throws CompositionError when setting an amount on a root, or a
     * non-positive amount
     * @throws FieldError if a field falls outside its limits
     * @throws NotFoundError for an unknown node or product type
     */
    auto updateNode(NodeId id, const NodeUpdate& update) -> CompositionNode;

    // ==================== Bill of materials ====================

    /**
     * @throws CompositionError if a material is repeated or already on the
     * node
     * @throws NotFoundError for an unknown node or material
     */
    auto addMaterials(NodeId nodeId, std::span<const MaterialLine> lines)
        -> CompositionNode;

    auto updateMaterial(NodeId nodeId, MaterialId materialId,
                        std::optional<double> quantity,
                        std::optional<Unit> unit) -> CompositionNode;

    /**
     * @throws NotFoundError if a material is not on the node
     * @throws IncompleteBomError if a leaf would be left without materials
     */
    auto removeMaterials(NodeId nodeId, std::span<const MaterialId> materialIds)
        -> CompositionNode;

    // ==================== Physical properties ====================

    [[nodiscard]] auto getPhysicalProperties(NodeId nodeId)
        -> PhysicalProperties;
    auto setPhysicalProperties(NodeId nodeId, const PhysicalProperties& props)
        -> PhysicalProperties;
    void removePhysicalProperties(NodeId nodeId);

    // ==================== Catalog ====================

    /**
     * @brief Distinct brands, trimmed and title-cased, sorted
     */
    [[nodiscard]] auto listBrands() -> std::vector<std::string>;

    void setPostDeleteHook(PostDeleteHook hook) {
        postDeleteHook_ = std::move(hook);
    }

    [[nodiscard]] auto settings() const noexcept
        -> const config::CompositionConfig& {
        return config_;
    }

private:
    auto requireNode(NodeId id) -> CompositionNode;

    std::shared_ptr<INodeStore> store_;
    std::shared_ptr<IOwnerDirectory> owners_;
    std::shared_ptr<IProductTypeCatalog> productTypes_;
    std::shared_ptr<IMaterialCatalog> materials_;
    config::CompositionConfig config_;

    CompositionBuilder builder_;
    SubtreeQueryService query_;
    BomAggregator aggregator_;
    PostDeleteHook postDeleteHook_;
};

/**
 * @brief Title-case a brand the way it is listed: trimmed, first letter of
 * every word upper case, the rest lower case
 */
[[nodiscard]] auto normalizeBrand(const std::string& brand) -> std::string;

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_SERVICE_COMPOSITION_SERVICE_HPP
