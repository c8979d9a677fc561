// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include "composition_builder.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "../errors.hpp"
#include "../validator/tree_invariant_validator.hpp"

namespace teardown::composition {

namespace {

/**
 * @brief Materials and product types referenced anywhere in a candidate
 */
struct References {
    std::vector<MaterialId> materials;
    std::set<ProductTypeId> productTypes;
};

auto collectReferences(const TreeDefinition& root) -> References {
    References refs;
    std::vector<const TreeDefinition*> stack{&root};
    while (!stack.empty()) {
        const auto* node = stack.back();
        stack.pop_back();
        for (const auto& line : node->billOfMaterials) {
            refs.materials.push_back(line.materialId);
        }
        if (node->productTypeId) {
            refs.productTypes.insert(*node->productTypeId);
        }
        for (const auto& child : node->components) {
            stack.push_back(&child);
        }
    }
    return refs;
}

/// Nodes without a dismantling start are stamped with the creation time
void stampStartTimes(TreeDefinition& node, Timestamp now) {
    if (!node.details.dismantlingTimeStart) {
        node.details.dismantlingTimeStart = now;
    }
    for (auto& child : node.components) {
        stampStartTimes(child, now);
    }
}

auto countNodes(const TreeDefinition& root) -> size_t {
    size_t count = 1;
    for (const auto& child : root.components) {
        count += countNodes(child);
    }
    return count;
}

}  // namespace

CompositionBuilder::CompositionBuilder(INodeStore& store,
                                       IOwnerDirectory& owners,
                                       IProductTypeCatalog& productTypes,
                                       IMaterialCatalog& materials)
    : store_(store),
      owners_(owners),
      productTypes_(productTypes),
      materials_(materials) {}

auto CompositionBuilder::createComposition(
    const TreeDefinition& definition, const OwnerId& ownerId,
    std::optional<ProductTypeId> productTypeId) -> NodeId {
    TreeDefinition candidate = definition;
    if (productTypeId) {
        candidate.productTypeId = productTypeId;
    }
    stampStartTimes(candidate, nowTimestamp());

    if (auto result =
            TreeInvariantValidator::validateTree(candidate, NodeRole::Root);
        !result) {
        SPDLOG_DEBUG("Rejected composition '{}': {}", definition.details.name,
                     result.error().message);
        THROW_VALIDATION_FAILURE(result.error());
    }

    if (!owners_.exists(ownerId)) {
        THROW_NOT_FOUND_ERROR(notFoundContext("owner", ownerId),
                              "Owner '" + ownerId + "' does not exist");
    }
    checkReferences(candidate);

    const NodeId rootId = persist(candidate, std::nullopt, ownerId);
    spdlog::info("Created composition {} '{}' for owner '{}' ({} nodes)",
                 rootId, definition.details.name, ownerId,
                 countNodes(candidate));
    return rootId;
}

auto CompositionBuilder::addComponent(NodeId parentId,
                                      const TreeDefinition& definition)
    -> NodeId {
    TreeDefinition candidate = definition;
    stampStartTimes(candidate, nowTimestamp());
    if (auto result =
            TreeInvariantValidator::validateTree(candidate, NodeRole::Child);
        !result) {
        THROW_VALIDATION_FAILURE(result.error());
    }

    auto parent = store_.get(parentId);
    if (!parent) {
        THROW_NOT_FOUND_ERROR(
            notFoundContext("node", std::to_string(parentId)),
            "Parent node " + std::to_string(parentId) + " does not exist");
    }

    const auto ancestors = ancestorChain(*parent);
    if (auto result =
            TreeInvariantValidator::checkAcyclic(candidate, ancestors);
        !result) {
        THROW_VALIDATION_FAILURE(result.error());
    }

    checkReferences(candidate);

    const NodeId childId = persist(candidate, parentId, parent->ownerId);
    spdlog::info("Added component {} '{}' under node {}", childId,
                 definition.details.name, parentId);
    return childId;
}

void CompositionBuilder::checkReferences(const TreeDefinition& definition) {
    const auto refs = collectReferences(definition);

    for (ProductTypeId productTypeId : refs.productTypes) {
        if (!productTypes_.exists(productTypeId)) {
            const auto id = std::to_string(productTypeId);
            THROW_NOT_FOUND_ERROR(notFoundContext("product type", id),
                                  "Product type " + id + " does not exist");
        }
    }

    if (refs.materials.empty()) {
        return;
    }
    if (auto result = materials_.existAll(refs.materials); !result) {
        ErrorContext context;
        context.entity = "material";
        context.constraint = "exists";
        std::string list;
        for (MaterialId id : result.error()) {
            context.missingIds.push_back(std::to_string(id));
            list += (list.empty() ? "" : ", ") + std::to_string(id);
        }
        THROW_NOT_FOUND_ERROR(context, "Unknown materials: " + list);
    }
}

auto CompositionBuilder::ancestorChain(const CompositionNode& parent)
    -> std::vector<NodeId> {
    std::vector<NodeId> chain{parent.id};
    std::unordered_set<NodeId> seen{parent.id};

    auto next = parent.parentId;
    while (next) {
        if (!seen.insert(*next).second) {
            SPDLOG_CRITICAL("Ancestor chain of node {} loops at node {}",
                            parent.id, *next);
            THROW_INVARIANT_VIOLATION_ERROR(
                nodeContext(*next, "acyclic"),
                "Stored ancestors of node " + std::to_string(parent.id) +
                    " form a cycle");
        }
        chain.push_back(*next);
        auto ancestor = store_.get(*next);
        if (!ancestor) {
            break;
        }
        next = ancestor->parentId;
    }
    return chain;
}

auto CompositionBuilder::persist(const TreeDefinition& definition,
                                 std::optional<NodeId> parentId,
                                 const OwnerId& ownerId) -> NodeId {
    auto txn = store_.beginTransaction();
    const NodeId id = insertTree(definition, parentId, ownerId);
    txn->commit();
    return id;
}

auto CompositionBuilder::insertTree(const TreeDefinition& definition,
                                    std::optional<NodeId> parentId,
                                    const OwnerId& ownerId) -> NodeId {
    CompositionNode row;
    row.parentId = parentId;
    row.amountInParent = parentId ? definition.amountInParent : std::nullopt;
    row.ownerId = ownerId;
    row.productTypeId = definition.productTypeId;
    row.details = definition.details;

    const NodeId id = store_.insert(row);
    for (const auto& line : definition.billOfMaterials) {
        store_.insertMaterialLine(id, line);
    }
    if (definition.physicalProperties &&
        !definition.physicalProperties->empty()) {
        store_.setPhysicalProperties(id, *definition.physicalProperties);
    }
    for (const auto& video : definition.videos) {
        store_.insertVideo(id, video);
    }

    for (const auto& child : definition.components) {
        insertTree(child, id, ownerId);
    }
    return id;
}

}  // namespace teardown::composition
