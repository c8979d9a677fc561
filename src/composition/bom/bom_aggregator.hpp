// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_BOM_BOM_AGGREGATOR_HPP
#define TEARDOWN_COMPOSITION_BOM_BOM_AGGREGATOR_HPP

#include <map>

#include <nlohmann/json_fwd.hpp>

#include "../model/node_index.hpp"
#include "../store/node_store.hpp"
#include "config/sections/composition_config.hpp"

namespace teardown::composition {

/**
 * @brief Total of one material and the unit it is reported in
 */
struct MaterialQuantity {
    double quantity = 0.0;
    Unit unit = Unit::Kilogram;

    bool operator==(const MaterialQuantity&) const = default;
};

/// Aggregated totals keyed by material id
using BillOfMaterials = std::map<MaterialId, MaterialQuantity>;

/**
 * @brief `{"materials": [{"materialId", "quantity", "unit"}, ...]}`
 */
[[nodiscard]] auto billOfMaterialsToJson(const BillOfMaterials& bom)
    -> nlohmann::json;

/**
 * @brief Sums material consumption over a composition tree
 *
 * Every line contributes quantity times the product of amountInParent along
 * the path to the root. How lines of one material in different units are
 * combined depends on the unit policy.
 */
class BomAggregator {
public:
    explicit BomAggregator(
        config::UnitPolicy policy = config::UnitPolicy::Normalize)
        : policy_(policy) {}

    /**
     * @brief Aggregate the subtree under @p rootId from a loaded forest
     *
     * @throws NotFoundError if @p rootId is not in @p index
     * @throws InvariantViolationError if a node is reached twice
     * @throws UnitMismatchError if the unit policy rejects a material
     */
    [[nodiscard]] auto aggregate(const NodeIndex& index, NodeId rootId) const
        -> BillOfMaterials;

    /**
     * @brief Load the whole subtree in one fetch, then aggregate it
     */
    [[nodiscard]] auto aggregate(INodeStore& store, NodeId rootId) const
        -> BillOfMaterials;

    [[nodiscard]] auto policy() const noexcept -> config::UnitPolicy {
        return policy_;
    }

private:
    void accumulate(BillOfMaterials& totals, NodeId nodeId,
                    const MaterialLine& line, double multiplier) const;

    config::UnitPolicy policy_;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_BOM_BOM_AGGREGATOR_HPP
