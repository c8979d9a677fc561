// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include "bom_aggregator.hpp"

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../errors.hpp"

namespace teardown::composition {

namespace {

auto mismatchContext(NodeId nodeId, MaterialId materialId) -> ErrorContext {
    ErrorContext context = nodeContext(nodeId, "unit_policy");
    context.entity = "material";
    context.missingIds = {std::to_string(materialId)};
    return context;
}

}  // namespace

auto billOfMaterialsToJson(const BillOfMaterials& bom) -> nlohmann::json {
    auto materials = nlohmann::json::array();
    for (const auto& [materialId, total] : bom) {
        materials.push_back({{"materialId", materialId},
                             {"quantity", total.quantity},
                             {"unit", unitToString(total.unit)}});
    }
    return {{"materials", materials}};
}

void BomAggregator::accumulate(BillOfMaterials& totals, NodeId nodeId,
                               const MaterialLine& line,
                               double multiplier) const {
    const double amount = line.quantity * multiplier;
    auto it = totals.find(line.materialId);

    switch (policy_) {
        case config::UnitPolicy::Normalize: {
            const Unit base = baseUnit(dimensionOf(line.unit));
            const double converted = toBaseUnit(amount, line.unit);
            if (it == totals.end()) {
                totals.emplace(line.materialId,
                               MaterialQuantity{converted, base});
                return;
            }
            if (it->second.unit != base) {
                THROW_UNIT_MISMATCH_ERROR(
                    mismatchContext(nodeId, line.materialId),
                    "Material " + std::to_string(line.materialId) +
                        " is measured as both " +
                        dimensionToString(dimensionOf(it->second.unit)) +
                        " and " + dimensionToString(dimensionOf(line.unit)));
            }
            it->second.quantity += converted;
            return;
        }
        case config::UnitPolicy::Reject:
            if (it != totals.end() && it->second.unit != line.unit) {
                THROW_UNIT_MISMATCH_ERROR(
                    mismatchContext(nodeId, line.materialId),
                    "Material " + std::to_string(line.materialId) +
                        " is listed in both " + unitToString(it->second.unit) +
                        " and " + unitToString(line.unit));
            }
            break;
        case config::UnitPolicy::Raw:
            break;
    }

    if (it == totals.end()) {
        totals.emplace(line.materialId, MaterialQuantity{amount, line.unit});
    } else {
        it->second.quantity += amount;
    }
}

auto BomAggregator::aggregate(const NodeIndex& index, NodeId rootId) const
    -> BillOfMaterials {
    if (!index.contains(rootId)) {
        THROW_NOT_FOUND_ERROR(
            notFoundContext("node", std::to_string(rootId)),
            "Node " + std::to_string(rootId) + " does not exist");
    }

    BillOfMaterials totals;
    std::unordered_set<NodeId> visited;
    std::vector<std::pair<NodeId, double>> stack{{rootId, 1.0}};

    while (!stack.empty()) {
        const auto [nodeId, multiplier] = stack.back();
        stack.pop_back();

        if (!visited.insert(nodeId).second) {
            SPDLOG_CRITICAL(
                "Composition data under node {} is cyclic: node {} reached "
                "twice",
                rootId, nodeId);
            THROW_INVARIANT_VIOLATION_ERROR(
                nodeContext(nodeId, "acyclic"),
                "Node " + std::to_string(nodeId) +
                    " is reachable twice from node " + std::to_string(rootId));
        }

        const auto* node = index.find(nodeId);
        if (node == nullptr) {
            continue;
        }
        for (const auto& line : node->billOfMaterials) {
            accumulate(totals, nodeId, line, multiplier);
        }
        for (auto it = node->components.rbegin(); it != node->components.rend();
             ++it) {
            const auto* child = index.find(*it);
            if (child == nullptr) {
                continue;
            }
            if (!child->amountInParent) {
                SPDLOG_CRITICAL("Component {} of node {} has no amount in parent",
                                *it, nodeId);
                THROW_INVARIANT_VIOLATION_ERROR(
                    nodeContext(*it, "child_amount_required"),
                    "Component " + std::to_string(*it) + " of node " +
                        std::to_string(nodeId) + " has no amount in parent");
            }
            stack.emplace_back(*it, multiplier * *child->amountInParent);
        }
    }

    SPDLOG_DEBUG("Aggregated {} materials over {} nodes under node {}",
                 totals.size(), visited.size(), rootId);
    return totals;
}

auto BomAggregator::aggregate(INodeStore& store, NodeId rootId) const
    -> BillOfMaterials {
    if (!store.exists(rootId)) {
        THROW_NOT_FOUND_ERROR(
            notFoundContext("node", std::to_string(rootId)),
            "Node " + std::to_string(rootId) + " does not exist");
    }
    const auto index = store.fetchForest(RootSelector{rootId}, std::nullopt);
    return aggregate(index, rootId);
}

}  // namespace teardown::composition
