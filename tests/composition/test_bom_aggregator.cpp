// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

/*
 * test_bom_aggregator.cpp
 *
 * Tests for BomAggregator
 * - Multipliers along the path to the root
 * - Summing a material across nodes and levels
 * - Unit policies: normalize, reject, raw
 * - Cyclic persisted data or a child without an amount raises
 *   InvariantViolationError
 * - Unknown roots are NotFound
 */

#include <gtest/gtest.h>

#include <string>

#include "composition/bom/bom_aggregator.hpp"
#include "composition/builder/composition_builder.hpp"
#include "composition/errors.hpp"
#include "composition_fixture.hpp"

#include <nlohmann/json.hpp>

using namespace teardown;
using namespace teardown::composition;
using namespace teardown::composition::test;

namespace {

auto node(NodeId id, std::optional<NodeId> parent, std::optional<double> amount,
          std::vector<MaterialLine> lines, std::vector<NodeId> children)
    -> CompositionNode {
    CompositionNode n;
    n.id = id;
    n.parentId = parent;
    n.amountInParent = amount;
    n.ownerId = "owner";
    n.details.name = "Node " + std::to_string(id);
    n.billOfMaterials = std::move(lines);
    n.components = std::move(children);
    return n;
}

}  // namespace

// ==================== Pure core ====================

TEST(BomAggregatorTest, MultipliesAlongPath) {
    NodeIndex index;
    index.add(node(1, std::nullopt, std::nullopt, {}, {2}));
    index.add(node(2, 1, 2.0, {}, {3}));
    index.add(node(3, 2, 3.0, {{7, 0.5, Unit::Kilogram}}, {}));
    index.addRoot(1);

    const auto totals = BomAggregator{}.aggregate(index, 1);
    ASSERT_EQ(totals.size(), 1u);
    EXPECT_DOUBLE_EQ(totals.at(7).quantity, 3.0);
    EXPECT_EQ(totals.at(7).unit, Unit::Kilogram);
}

TEST(BomAggregatorTest, SumsAcrossNodesAndLevels) {
    // Table (1 kg steel) -> 4 x Leg (0.5 kg steel, 0.2 kg wood)
    //                    -> 1 x Top (3 kg wood)
    NodeIndex index;
    index.add(node(1, std::nullopt, std::nullopt, {{1, 1.0, Unit::Kilogram}},
                   {2, 3}));
    index.add(node(2, 1, 4.0,
                   {{1, 0.5, Unit::Kilogram}, {2, 0.2, Unit::Kilogram}}, {}));
    index.add(node(3, 1, 1.0, {{2, 3.0, Unit::Kilogram}}, {}));

    const auto totals = BomAggregator{}.aggregate(index, 1);
    EXPECT_DOUBLE_EQ(totals.at(1).quantity, 3.0);
    EXPECT_DOUBLE_EQ(totals.at(2).quantity, 3.8);
}

TEST(BomAggregatorTest, AggregatesFromInnerNode) {
    NodeIndex index;
    index.add(node(1, std::nullopt, std::nullopt, {}, {2}));
    index.add(node(2, 1, 5.0, {{1, 2.0, Unit::Kilogram}}, {}));

    const auto totals = BomAggregator{}.aggregate(index, 2);
    EXPECT_DOUBLE_EQ(totals.at(1).quantity, 2.0);
}

TEST(BomAggregatorTest, NormalizeConvertsToBaseUnit) {
    NodeIndex index;
    index.add(node(1, std::nullopt, std::nullopt, {{1, 500.0, Unit::Gram}},
                   {2}));
    index.add(node(2, 1, 2.0, {{1, 1.0, Unit::Kilogram},
                               {2, 150.0, Unit::Centimeter}}, {}));

    const auto totals =
        BomAggregator{config::UnitPolicy::Normalize}.aggregate(index, 1);
    EXPECT_DOUBLE_EQ(totals.at(1).quantity, 2.5);
    EXPECT_EQ(totals.at(1).unit, Unit::Kilogram);
    EXPECT_DOUBLE_EQ(totals.at(2).quantity, 3.0);
    EXPECT_EQ(totals.at(2).unit, Unit::Meter);
}

TEST(BomAggregatorTest, NormalizeRejectsMixedDimensions) {
    NodeIndex index;
    index.add(node(1, std::nullopt, std::nullopt, {{1, 1.0, Unit::Kilogram}},
                   {2}));
    index.add(node(2, 1, 1.0, {{1, 2.0, Unit::Meter}}, {}));

    EXPECT_THROW(
        (void)BomAggregator{config::UnitPolicy::Normalize}.aggregate(index, 1),
        UnitMismatchError);
}

TEST(BomAggregatorTest, RejectPolicyRefusesMixedUnits) {
    NodeIndex index;
    index.add(node(1, std::nullopt, std::nullopt, {{1, 1.0, Unit::Kilogram}},
                   {2}));
    index.add(node(2, 1, 1.0, {{1, 200.0, Unit::Gram}}, {}));

    EXPECT_THROW(
        (void)BomAggregator{config::UnitPolicy::Reject}.aggregate(index, 1),
        UnitMismatchError);
}

TEST(BomAggregatorTest, RejectPolicyKeepsSingleUnit) {
    NodeIndex index;
    index.add(node(1, std::nullopt, std::nullopt, {{1, 100.0, Unit::Gram}},
                   {2}));
    index.add(node(2, 1, 3.0, {{1, 200.0, Unit::Gram}}, {}));

    const auto totals =
        BomAggregator{config::UnitPolicy::Reject}.aggregate(index, 1);
    EXPECT_DOUBLE_EQ(totals.at(1).quantity, 700.0);
    EXPECT_EQ(totals.at(1).unit, Unit::Gram);
}

TEST(BomAggregatorTest, RawPolicySumsAsStoredInFirstUnit) {
    NodeIndex index;
    index.add(node(1, std::nullopt, std::nullopt, {{1, 1.0, Unit::Kilogram}},
                   {2}));
    index.add(node(2, 1, 2.0, {{1, 250.0, Unit::Gram}}, {}));

    const auto totals =
        BomAggregator{config::UnitPolicy::Raw}.aggregate(index, 1);
    EXPECT_DOUBLE_EQ(totals.at(1).quantity, 501.0);
    EXPECT_EQ(totals.at(1).unit, Unit::Kilogram);
}

TEST(BomAggregatorTest, CycleIsInvariantViolation) {
    NodeIndex index;
    index.add(node(1, 2, 1.0, {{1, 1.0, Unit::Kilogram}}, {2}));
    index.add(node(2, 1, 1.0, {}, {1}));

    try {
        (void)BomAggregator{}.aggregate(index, 1);
        FAIL() << "Expected InvariantViolationError";
    } catch (const InvariantViolationError& e) {
        EXPECT_EQ(e.context().nodeId, 1);
        EXPECT_EQ(e.context().constraint, "acyclic");
    }
}

TEST(BomAggregatorTest, ChildWithoutAmountIsInvariantViolation) {
    NodeIndex index;
    index.add(node(1, std::nullopt, std::nullopt, {}, {2}));
    index.add(node(2, 1, std::nullopt, {{1, 4.0, Unit::Kilogram}}, {}));

    try {
        (void)BomAggregator{}.aggregate(index, 1);
        FAIL() << "Expected InvariantViolationError";
    } catch (const InvariantViolationError& e) {
        EXPECT_EQ(e.context().nodeId, 2);
        EXPECT_EQ(e.context().constraint, "child_amount_required");
    }
}

TEST(BomAggregatorTest, MissingRootIsNotFound) {
    NodeIndex index;
    EXPECT_THROW((void)BomAggregator{}.aggregate(index, 5), NotFoundError);
}

TEST(BomAggregatorTest, JsonEncoding) {
    BillOfMaterials bom{{3, {1.5, Unit::Kilogram}}, {9, {2.0, Unit::Meter}}};
    const auto j = billOfMaterialsToJson(bom);
    ASSERT_EQ(j.at("materials").size(), 2u);
    EXPECT_EQ(j.at("materials")[0].at("materialId"), 3);
    EXPECT_EQ(j.at("materials")[1].at("unit"), "m");
}

// ==================== Store adapter ====================

class BomAggregatorStoreTest : public CompositionFixture {};

TEST_F(BomAggregatorStoreTest, ChairScenario) {
    CompositionBuilder builder(*backend.nodes, *backend.catalog,
                               *backend.catalog, *backend.catalog);
    const NodeId root = builder.createComposition(chairDefinition(foam), OWNER);

    const auto totals = BomAggregator{}.aggregate(*backend.nodes, root);
    ASSERT_EQ(totals.size(), 1u);
    EXPECT_DOUBLE_EQ(totals.at(foam).quantity, 3.0);
}

TEST_F(BomAggregatorStoreTest, MatchesManualSumForWideTree) {
    CompositionBuilder builder(*backend.nodes, *backend.catalog,
                               *backend.catalog, *backend.catalog);

    // Bike: frame (2 kg steel), 2 wheels each with 32 spokes (0.01 kg steel)
    // and a rim (0.6 kg steel, 0.3 kg wood)
    TreeDefinition wheel;
    wheel.details.name = "Wheel";
    wheel.amountInParent = 2.0;
    wheel.components.push_back(leafDefinition("Spoke", 32.0, steel, 0.01));
    auto rim = leafDefinition("Rim", 1.0, steel, 0.6);
    rim.billOfMaterials.push_back({wood, 0.3, Unit::Kilogram});
    wheel.components.push_back(rim);

    TreeDefinition bike;
    bike.details.name = "Bike";
    bike.billOfMaterials.push_back({steel, 2.0, Unit::Kilogram});
    bike.components.push_back(wheel);

    const NodeId root = builder.createComposition(bike, OWNER);
    const auto totals = BomAggregator{}.aggregate(*backend.nodes, root);

    EXPECT_NEAR(totals.at(steel).quantity, 2.0 + 2 * (32 * 0.01 + 0.6), 1e-9);
    EXPECT_NEAR(totals.at(wood).quantity, 2 * 0.3, 1e-9);
}

TEST_F(BomAggregatorStoreTest, PersistedCycleIsInvariantViolation) {
    CompositionBuilder builder(*backend.nodes, *backend.catalog,
                               *backend.catalog, *backend.catalog);
    TreeDefinition root;
    root.details.name = "Loop";
    root.components.push_back(leafDefinition("Back", 1.0, foam, 1.0));
    const NodeId rootId = builder.createComposition(root, OWNER);
    const NodeId childId = backend.nodes->get(rootId)->components[0];

    // Corrupt the tree behind the store's back
    auto stmt = backend.database->prepare(
        "UPDATE composition_nodes SET parent_id = ?, amount_in_parent = 1 "
        "WHERE id = ?");
    stmt->bind(1, childId).bind(2, rootId);
    stmt->execute();

    EXPECT_THROW((void)BomAggregator{}.aggregate(*backend.nodes, rootId),
                 InvariantViolationError);
}

TEST_F(BomAggregatorStoreTest, UnknownRootIsNotFound) {
    EXPECT_THROW((void)BomAggregator{}.aggregate(*backend.nodes, 404),
                 NotFoundError);
}
