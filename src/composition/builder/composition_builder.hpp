// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_BUILDER_COMPOSITION_BUILDER_HPP
#define TEARDOWN_COMPOSITION_BUILDER_COMPOSITION_BUILDER_HPP

#include <optional>

#include "../model/tree_definition.hpp"
#include "../store/node_store.hpp"
#include "../store/reference_catalog.hpp"

namespace teardown::composition {

/**
 * @brief Writes validated candidate trees to the node store
 *
 * The whole candidate is validated and every reference resolved before the
 * first write. Rows are then inserted depth-first in pre-order inside a
 * single transaction: either every node of the tree is stored or none is.
 */
class CompositionBuilder {
public:
    CompositionBuilder(INodeStore& store, IOwnerDirectory& owners,
                       IProductTypeCatalog& productTypes,
                       IMaterialCatalog& materials);

    /**
     * @brief Store @p definition as a new root owned by @p ownerId
     *
     * @param productTypeId Overrides the root's own product type when set
     * @return Id of the new root
     * @throws ValidationError subclasses for structural or field violations
     * @throws NotFoundError for an unknown owner, product type or material
     * @throws IntegrityError if the database rejects the rows
     */
    auto createComposition(const TreeDefinition& definition,
                           const OwnerId& ownerId,
                           std::optional<ProductTypeId> productTypeId =
                               std::nullopt) -> NodeId;

    /**
     * @brief Graft @p definition under an existing node
     *
     * The new sub-tree inherits the parent's owner. Declared ids in the
     * definition may not repeat the parent or any of its ancestors.
     *
     * @return Id of the new sub-tree root
     * @throws CycleError if a declared id collides with the ancestor chain
     * @throws NotFoundError if the parent does not exist
     */
    auto addComponent(NodeId parentId, const TreeDefinition& definition)
        -> NodeId;

private:
    void checkReferences(const TreeDefinition& definition);
    auto ancestorChain(const CompositionNode& parent) -> std::vector<NodeId>;
    auto persist(const TreeDefinition& definition,
                 std::optional<NodeId> parentId, const OwnerId& ownerId)
        -> NodeId;
    auto insertTree(const TreeDefinition& definition,
                    std::optional<NodeId> parentId, const OwnerId& ownerId)
        -> NodeId;

    INodeStore& store_;
    IOwnerDirectory& owners_;
    IProductTypeCatalog& productTypes_;
    IMaterialCatalog& materials_;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_BUILDER_COMPOSITION_BUILDER_HPP
