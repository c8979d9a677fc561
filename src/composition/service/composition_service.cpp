// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include "composition_service.hpp"

#include <cctype>
#include <set>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "../errors.hpp"
#include "../validator/tree_invariant_validator.hpp"

namespace teardown::composition {

namespace {

void applyText(std::optional<std::string>& field,
               const std::optional<std::string>& value) {
    if (!value) {
        return;
    }
    if (value->empty()) {
        field.reset();
    } else {
        field = *value;
    }
}

auto missingMaterial(NodeId nodeId, MaterialId materialId) -> ErrorContext {
    auto context = notFoundContext("material", std::to_string(materialId));
    context.nodeId = nodeId;
    return context;
}

}  // namespace

auto normalizeBrand(const std::string& brand) -> std::string {
    const auto first = brand.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = brand.find_last_not_of(" \t\n\r\f\v");

    std::string result = brand.substr(first, last - first + 1);
    bool startOfWord = true;
    for (char& c : result) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            c = static_cast<char>(startOfWord ? std::toupper(uc)
                                              : std::tolower(uc));
            startOfWord = false;
        } else {
            startOfWord = true;
        }
    }
    return result;
}

CompositionService::CompositionService(
    std::shared_ptr<INodeStore> store, std::shared_ptr<IOwnerDirectory> owners,
    std::shared_ptr<IProductTypeCatalog> productTypes,
    std::shared_ptr<IMaterialCatalog> materials,
    config::CompositionConfig settings)
    : store_(std::move(store)),
      owners_(std::move(owners)),
      productTypes_(std::move(productTypes)),
      materials_(std::move(materials)),
      config_(settings),
      builder_(*store_, *owners_, *productTypes_, *materials_),
      query_(*store_, config_.maxSubtreeDepth),
      aggregator_(config_.unitPolicy) {
    spdlog::info("CompositionService ready (maxSubtreeDepth={}, unitPolicy={})",
                 config_.maxSubtreeDepth,
                 config::unitPolicyToString(config_.unitPolicy));
}

// ============================================================================
// Trees
// ============================================================================

auto CompositionService::createComposition(
    const TreeDefinition& definition, const OwnerId& ownerId,
    std::optional<ProductTypeId> productTypeId) -> NodeId {
    return builder_.createComposition(definition, ownerId, productTypeId);
}

auto CompositionService::addComponent(NodeId parentId,
                                      const TreeDefinition& definition)
    -> NodeId {
    return builder_.addComponent(parentId, definition);
}

auto CompositionService::getSubtree(const RootSelector& selector,
                                    int maxDepth) -> TreeView {
    return query_.getSubtree(selector, maxDepth);
}

auto CompositionService::aggregateBillOfMaterials(NodeId rootId)
    -> BillOfMaterials {
    return aggregator_.aggregate(*store_, rootId);
}

auto CompositionService::deleteSubtree(NodeId id) -> std::vector<NodeId> {
    const auto node = requireNode(id);

    if (node.parentId) {
        if (auto parent = store_->get(*node.parentId);
            parent && parent->billOfMaterials.empty() &&
            parent->components.size() == 1) {
            THROW_COMPOSITION_ERROR(
                nodeContext(parent->id, "non_empty_composition"),
                "Deleting node " + std::to_string(id) + " would leave node " +
                    std::to_string(parent->id) +
                    " with neither materials nor components");
        }
    }

    auto txn = store_->beginTransaction();
    auto removed = store_->deleteSubtree(id);
    txn->commit();

    if (postDeleteHook_) {
        try {
            postDeleteHook_(removed);
        } catch (const std::exception& e) {
            SPDLOG_WARN("Post-delete hook failed for subtree {}: {}", id,
                        e.what());
        }
    }
    return removed;
}

void CompositionService::validateSubtree(NodeId id) {
    if (!store_->exists(id)) {
        THROW_NOT_FOUND_ERROR(notFoundContext("node", std::to_string(id)),
                              "Node " + std::to_string(id) +
                                  " does not exist");
    }
    const auto index = store_->fetchForest(RootSelector{id}, std::nullopt);
    if (auto result = TreeInvariantValidator::validateStoredSubtree(index, id);
        !result) {
        SPDLOG_WARN("Stored subtree {} is invalid: {}", id,
                    result.error().message);
        THROW_VALIDATION_FAILURE(result.error());
    }
}

// ============================================================================
// Nodes
// ============================================================================

auto CompositionService::requireNode(NodeId id) -> CompositionNode {
    auto node = store_->get(id);
    if (!node) {
        THROW_NOT_FOUND_ERROR(notFoundContext("node", std::to_string(id)),
                              "Node " + std::to_string(id) +
                                  " does not exist");
    }
    return std::move(*node);
}

auto CompositionService::getNode(NodeId id) -> CompositionNode {
    return requireNode(id);
}

auto CompositionService::updateNode(NodeId id, const NodeUpdate& update)
    -> CompositionNode {
    auto node = requireNode(id);
    if (update.empty()) {
        return node;
    }

    if (update.amountInParent) {
        const auto role = node.isRoot() ? NodeRole::Root : NodeRole::Child;
        if (auto result = TreeInvariantValidator::checkAmount(
                update.amountInParent, role, nodeContext(id));
            !result) {
            THROW_VALIDATION_FAILURE(result.error());
        }
        node.amountInParent = update.amountInParent;
    }

    if (update.productTypeId) {
        if (!productTypes_->exists(*update.productTypeId)) {
            const auto typeId = std::to_string(*update.productTypeId);
            THROW_NOT_FOUND_ERROR(notFoundContext("product type", typeId),
                                  "Product type " + typeId +
                                      " does not exist");
        }
        node.productTypeId = update.productTypeId;
    }

    if (update.name) {
        node.details.name = *update.name;
    }
    applyText(node.details.description, update.description);
    applyText(node.details.brand, update.brand);
    applyText(node.details.model, update.model);
    applyText(node.details.dismantlingNotes, update.dismantlingNotes);
    if (update.dismantlingTimeStart) {
        node.details.dismantlingTimeStart = update.dismantlingTimeStart;
    }
    if (update.dismantlingTimeEnd) {
        node.details.dismantlingTimeEnd = update.dismantlingTimeEnd;
    }

    if (auto result = TreeInvariantValidator::checkDetails(node.details,
                                                           nodeContext(id));
        !result) {
        THROW_VALIDATION_FAILURE(result.error());
    }

    store_->updateNode(node);
    SPDLOG_DEBUG("Updated node {}", id);
    return requireNode(id);
}

// ============================================================================
// Bill of materials
// ============================================================================

auto CompositionService::addMaterials(NodeId nodeId,
                                      std::span<const MaterialLine> lines)
    -> CompositionNode {
    const auto node = requireNode(nodeId);
    if (lines.empty()) {
        return node;
    }

    std::unordered_set<MaterialId> seen;
    std::vector<MaterialId> ids;
    for (const auto& line : lines) {
        if (auto result = TreeInvariantValidator::checkMaterialLine(
                line, nodeContext(nodeId));
            !result) {
            THROW_VALIDATION_FAILURE(result.error());
        }
        if (!seen.insert(line.materialId).second ||
            node.findMaterial(line.materialId) != nullptr) {
            THROW_COMPOSITION_ERROR(
                nodeContext(nodeId, "unique_material_per_node"),
                "Material " + std::to_string(line.materialId) +
                    " is already listed on node " + std::to_string(nodeId));
        }
        ids.push_back(line.materialId);
    }

    if (auto result = materials_->existAll(ids); !result) {
        ErrorContext context = nodeContext(nodeId, "exists");
        context.entity = "material";
        for (MaterialId id : result.error()) {
            context.missingIds.push_back(std::to_string(id));
        }
        THROW_NOT_FOUND_ERROR(context, "Unknown materials on node " +
                                           std::to_string(nodeId));
    }

    auto txn = store_->beginTransaction();
    for (const auto& line : lines) {
        store_->insertMaterialLine(nodeId, line);
    }
    txn->commit();

    SPDLOG_DEBUG("Added {} materials to node {}", lines.size(), nodeId);
    return requireNode(nodeId);
}

auto CompositionService::updateMaterial(NodeId nodeId, MaterialId materialId,
                                        std::optional<double> quantity,
                                        std::optional<Unit> unit)
    -> CompositionNode {
    const auto node = requireNode(nodeId);
    const auto* current = node.findMaterial(materialId);
    if (current == nullptr) {
        THROW_NOT_FOUND_ERROR(missingMaterial(nodeId, materialId),
                              "Material " + std::to_string(materialId) +
                                  " is not on node " + std::to_string(nodeId));
    }

    MaterialLine line = *current;
    line.quantity = quantity.value_or(line.quantity);
    line.unit = unit.value_or(line.unit);
    if (auto result = TreeInvariantValidator::checkMaterialLine(
            line, nodeContext(nodeId));
        !result) {
        THROW_VALIDATION_FAILURE(result.error());
    }

    store_->updateMaterialLine(nodeId, line);
    return requireNode(nodeId);
}

auto CompositionService::removeMaterials(
    NodeId nodeId, std::span<const MaterialId> materialIds)
    -> CompositionNode {
    const auto node = requireNode(nodeId);

    std::set<MaterialId> removing;
    for (MaterialId materialId : materialIds) {
        if (node.findMaterial(materialId) == nullptr) {
            THROW_NOT_FOUND_ERROR(missingMaterial(nodeId, materialId),
                                  "Material " + std::to_string(materialId) +
                                      " is not on node " +
                                      std::to_string(nodeId));
        }
        removing.insert(materialId);
    }
    if (removing.empty()) {
        return node;
    }

    if (node.isLeaf() && removing.size() == node.billOfMaterials.size()) {
        THROW_INCOMPLETE_BOM_ERROR(
            nodeContext(nodeId, "leaf_has_materials"),
            "Node " + std::to_string(nodeId) +
                " has no components and must keep at least one material");
    }

    const std::vector<MaterialId> ids(removing.begin(), removing.end());
    auto txn = store_->beginTransaction();
    store_->deleteMaterialLines(nodeId, ids);
    txn->commit();
    return requireNode(nodeId);
}

// ============================================================================
// Physical properties
// ============================================================================

auto CompositionService::getPhysicalProperties(NodeId nodeId)
    -> PhysicalProperties {
    const auto node = requireNode(nodeId);
    if (!node.physicalProperties) {
        ErrorContext context = nodeContext(nodeId, "exists");
        context.entity = "physical properties";
        THROW_NOT_FOUND_ERROR(context, "Node " + std::to_string(nodeId) +
                                           " has no physical properties");
    }
    return *node.physicalProperties;
}

auto CompositionService::setPhysicalProperties(NodeId nodeId,
                                               const PhysicalProperties& props)
    -> PhysicalProperties {
    if (!store_->exists(nodeId)) {
        THROW_NOT_FOUND_ERROR(notFoundContext("node", std::to_string(nodeId)),
                              "Node " + std::to_string(nodeId) +
                                  " does not exist");
    }
    if (auto result = TreeInvariantValidator::checkPhysicalProperties(
            props, nodeContext(nodeId));
        !result) {
        THROW_VALIDATION_FAILURE(result.error());
    }
    store_->setPhysicalProperties(nodeId, props);
    return props;
}

void CompositionService::removePhysicalProperties(NodeId nodeId) {
    if (!store_->exists(nodeId)) {
        THROW_NOT_FOUND_ERROR(notFoundContext("node", std::to_string(nodeId)),
                              "Node " + std::to_string(nodeId) +
                                  " does not exist");
    }
    if (!store_->deletePhysicalProperties(nodeId)) {
        ErrorContext context = nodeContext(nodeId, "exists");
        context.entity = "physical properties";
        THROW_NOT_FOUND_ERROR(context, "Node " + std::to_string(nodeId) +
                                           " has no physical properties");
    }
}

// ============================================================================
// Catalog
// ============================================================================

auto CompositionService::listBrands() -> std::vector<std::string> {
    std::set<std::string> brands;
    for (const auto& brand : store_->listBrands()) {
        if (auto normalized = normalizeBrand(brand); !normalized.empty()) {
            brands.insert(std::move(normalized));
        }
    }
    return {brands.begin(), brands.end()};
}

}  // namespace teardown::composition
