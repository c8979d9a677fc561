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
 * test_composition_builder.cpp
 *
 * Tests for CompositionBuilder
 * - Creating a nested tree writes every node in one transaction
 * - Invalid candidates are rejected before any store call, including a
 *   dismantling end that precedes the defaulted start
 * - Unknown owners, product types and materials are NotFound
 * - Grafting a sub-tree under an existing node
 * - Declared ids colliding with the parent chain raise CycleError
 * - Failures inside the transaction leave no rows behind
 */

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "composition/builder/composition_builder.hpp"
#include "composition/errors.hpp"
#include "composition_fixture.hpp"

using namespace teardown::composition;
using namespace teardown::composition::test;

namespace {

/**
 * @brief Forwards to a real store and counts every call
 */
class CountingStore : public INodeStore {
public:
    explicit CountingStore(INodeStore& inner) : inner_(inner) {}

    auto beginTransaction() -> std::unique_ptr<StoreTransaction> override {
        ++calls;
        return inner_.beginTransaction();
    }
    auto get(NodeId id) -> std::optional<CompositionNode> override {
        ++calls;
        return inner_.get(id);
    }
    auto exists(NodeId id) -> bool override {
        ++calls;
        return inner_.exists(id);
    }
    auto getChildren(NodeId id) -> std::vector<CompositionNode> override {
        ++calls;
        return inner_.getChildren(id);
    }
    auto getMany(std::span<const NodeId> ids)
        -> std::vector<CompositionNode> override {
        ++calls;
        return inner_.getMany(ids);
    }
    auto fetchForest(const RootSelector& selector, std::optional<int> depth)
        -> NodeIndex override {
        ++calls;
        return inner_.fetchForest(selector, depth);
    }
    auto listRootIds() -> std::vector<NodeId> override {
        ++calls;
        return inner_.listRootIds();
    }
    auto listBrands() -> std::vector<std::string> override {
        ++calls;
        return inner_.listBrands();
    }
    auto insert(const CompositionNode& node) -> NodeId override {
        ++calls;
        ++inserts;
        if (failOnInsert != 0 && inserts == failOnInsert) {
            THROW_INTEGRITY_ERROR(ErrorContext{}, "injected failure");
        }
        return inner_.insert(node);
    }
    void updateNode(const CompositionNode& node) override {
        ++calls;
        inner_.updateNode(node);
    }
    void insertMaterialLine(NodeId nodeId, const MaterialLine& line) override {
        ++calls;
        inner_.insertMaterialLine(nodeId, line);
    }
    void updateMaterialLine(NodeId nodeId, const MaterialLine& line) override {
        ++calls;
        inner_.updateMaterialLine(nodeId, line);
    }
    void deleteMaterialLines(NodeId nodeId,
                             std::span<const MaterialId> ids) override {
        ++calls;
        inner_.deleteMaterialLines(nodeId, ids);
    }
    void setPhysicalProperties(NodeId nodeId,
                               const PhysicalProperties& props) override {
        ++calls;
        inner_.setPhysicalProperties(nodeId, props);
    }
    auto deletePhysicalProperties(NodeId nodeId) -> bool override {
        ++calls;
        return inner_.deletePhysicalProperties(nodeId);
    }
    void insertVideo(NodeId nodeId, const VideoLink& video) override {
        ++calls;
        inner_.insertVideo(nodeId, video);
    }
    auto deleteSubtree(NodeId id) -> std::vector<NodeId> override {
        ++calls;
        return inner_.deleteSubtree(id);
    }

    int calls = 0;
    int inserts = 0;
    int failOnInsert = 0;

private:
    INodeStore& inner_;
};

}  // namespace

class CompositionBuilderTest : public CompositionFixture {
protected:
    void SetUp() override {
        CompositionFixture::SetUp();
        counting = std::make_unique<CountingStore>(*backend.nodes);
        builder = std::make_unique<CompositionBuilder>(
            *counting, *backend.catalog, *backend.catalog, *backend.catalog);
    }

    std::unique_ptr<CountingStore> counting;
    std::unique_ptr<CompositionBuilder> builder;
};

TEST_F(CompositionBuilderTest, CreatesNestedTree) {
    const NodeId root = builder->createComposition(chairDefinition(foam), OWNER);

    auto chair = backend.nodes->get(root);
    ASSERT_TRUE(chair.has_value());
    EXPECT_TRUE(chair->isRoot());
    ASSERT_EQ(chair->components.size(), 1u);

    auto seat = backend.nodes->get(chair->components[0]);
    ASSERT_TRUE(seat.has_value());
    EXPECT_EQ(seat->details.name, "Seat");
    EXPECT_EQ(seat->parentId, root);
    EXPECT_EQ(seat->amountInParent, 2.0);
    EXPECT_EQ(seat->ownerId, OWNER);

    auto cushion = backend.nodes->get(seat->components[0]);
    ASSERT_TRUE(cushion.has_value());
    EXPECT_EQ(cushion->amountInParent, 3.0);
    ASSERT_EQ(cushion->billOfMaterials.size(), 1u);
    EXPECT_EQ(cushion->billOfMaterials[0].materialId, foam);
    EXPECT_EQ(cushion->ownerId, OWNER);

    EXPECT_EQ(count("composition_nodes"), 3);
}

TEST_F(CompositionBuilderTest, StoresAttachedData) {
    auto definition = leafDefinition("Lamp", 1.0, steel, 0.8);
    definition.amountInParent.reset();
    PhysicalProperties props;
    props.weightKg = 1.2;
    definition.physicalProperties = props;
    definition.videos.push_back(
        {"https://example.com/lamp", "Lamp teardown", std::nullopt});

    const NodeId root = builder->createComposition(definition, OWNER);
    auto lamp = backend.nodes->get(root);
    ASSERT_TRUE(lamp->physicalProperties.has_value());
    EXPECT_EQ(lamp->physicalProperties->weightKg, 1.2);
    ASSERT_EQ(lamp->videos.size(), 1u);
}

TEST_F(CompositionBuilderTest, ProductTypeOverrideApplied) {
    const ProductTypeId furniture = backend.catalog->addProductType("Furniture");
    const NodeId root =
        builder->createComposition(chairDefinition(foam), OWNER, furniture);
    EXPECT_EQ(backend.nodes->get(root)->productTypeId, furniture);
}

TEST_F(CompositionBuilderTest, EmptyRootRejectedWithoutStoreCalls) {
    TreeDefinition empty;
    empty.details.name = "Nothing";

    EXPECT_THROW(builder->createComposition(empty, OWNER), CompositionError);
    EXPECT_EQ(counting->calls, 0);
    EXPECT_EQ(count("composition_nodes"), 0);
}

TEST_F(CompositionBuilderTest, DeepViolationRejectedWithoutStoreCalls) {
    auto definition = chairDefinition(foam);
    TreeDefinition hollow;
    hollow.details.name = "Hollow";
    hollow.amountInParent = 1.0;
    definition.components[0].components.push_back(hollow);

    try {
        (void)builder->createComposition(definition, OWNER);
        FAIL() << "Expected CompositionError";
    } catch (const CompositionError& e) {
        EXPECT_EQ(e.context().nodePath, "Chair/Seat/Hollow");
        EXPECT_EQ(e.context().constraint, "non_empty_composition");
    }
    EXPECT_EQ(counting->calls, 0);
    EXPECT_EQ(count("composition_nodes"), 0);
}

TEST_F(CompositionBuilderTest, PastEndWithoutStartRejectedWithoutStoreCalls) {
    auto definition = leafDefinition("Radio", 1.0, steel, 0.3);
    definition.amountInParent.reset();
    definition.details.dismantlingTimeEnd =
        Timestamp{std::chrono::seconds{1000}};

    try {
        (void)builder->createComposition(definition, OWNER);
        FAIL() << "Expected FieldError";
    } catch (const FieldError& e) {
        EXPECT_EQ(e.context().constraint, "dismantling_time_order");
    }
    EXPECT_EQ(counting->calls, 0);
    EXPECT_EQ(count("composition_nodes"), 0);
}

TEST_F(CompositionBuilderTest, MissingStartDefaultsToCreationTime) {
    const auto before = nowTimestamp();
    auto definition = chairDefinition(foam);
    definition.details.dismantlingTimeEnd =
        before + std::chrono::hours{1};

    const NodeId root = builder->createComposition(definition, OWNER);
    auto chair = backend.nodes->get(root);
    ASSERT_TRUE(chair->details.dismantlingTimeStart.has_value());
    EXPECT_GE(*chair->details.dismantlingTimeStart, before);
    EXPECT_LE(*chair->details.dismantlingTimeStart,
              *chair->details.dismantlingTimeEnd);
}

TEST_F(CompositionBuilderTest, AddComponentWithPastEndRejected) {
    const NodeId root = builder->createComposition(chairDefinition(foam), OWNER);
    auto definition = leafDefinition("Leg", 4.0, wood, 45.0, Unit::Centimeter);
    definition.details.dismantlingTimeEnd =
        Timestamp{std::chrono::seconds{1000}};

    const int rows = count("composition_nodes");
    EXPECT_THROW(builder->addComponent(root, definition), FieldError);
    EXPECT_EQ(count("composition_nodes"), rows);
}

TEST_F(CompositionBuilderTest, RootAmountRejected) {
    auto definition = chairDefinition(foam);
    definition.amountInParent = 1.0;
    EXPECT_THROW(builder->createComposition(definition, OWNER),
                 CompositionError);
    EXPECT_EQ(count("composition_nodes"), 0);
}

TEST_F(CompositionBuilderTest, UnknownOwnerIsNotFound) {
    try {
        (void)builder->createComposition(chairDefinition(foam), "stranger");
        FAIL() << "Expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.context().entity, "owner");
        EXPECT_EQ(e.context().missingIds, std::vector<std::string>{"stranger"});
    }
    EXPECT_EQ(count("composition_nodes"), 0);
}

TEST_F(CompositionBuilderTest, UnknownProductTypeIsNotFound) {
    EXPECT_THROW(
        builder->createComposition(chairDefinition(foam), OWNER, 404),
        NotFoundError);
}

TEST_F(CompositionBuilderTest, UnknownMaterialsListedTogether) {
    auto definition = chairDefinition(foam);
    definition.components.push_back(leafDefinition("Frame", 1.0, 501, 2.0));
    definition.components.push_back(leafDefinition("Bolt", 4.0, 500, 0.01));

    try {
        (void)builder->createComposition(definition, OWNER);
        FAIL() << "Expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.context().entity, "material");
        EXPECT_EQ(e.context().missingIds,
                  (std::vector<std::string>{"500", "501"}));
    }
    EXPECT_EQ(count("composition_nodes"), 0);
}

TEST_F(CompositionBuilderTest, FailureMidTreeRollsBackEverything) {
    counting->failOnInsert = 3;
    EXPECT_THROW(builder->createComposition(chairDefinition(foam), OWNER),
                 IntegrityError);
    EXPECT_EQ(count("composition_nodes"), 0);
    EXPECT_EQ(count("bill_of_materials"), 0);
}

TEST_F(CompositionBuilderTest, AddComponentInheritsOwner) {
    const NodeId root = builder->createComposition(chairDefinition(foam), OWNER);
    const NodeId leg =
        builder->addComponent(root, leafDefinition("Leg", 4.0, wood, 0.3));

    auto node = backend.nodes->get(leg);
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ(node->parentId, root);
    EXPECT_EQ(node->ownerId, OWNER);
    EXPECT_EQ(backend.nodes->get(root)->components.size(), 2u);
}

TEST_F(CompositionBuilderTest, AddComponentToMissingParentIsNotFound) {
    EXPECT_THROW(
        builder->addComponent(9999, leafDefinition("Leg", 4.0, wood, 0.3)),
        NotFoundError);
}

TEST_F(CompositionBuilderTest, AddComponentRequiresAmount) {
    const NodeId root = builder->createComposition(chairDefinition(foam), OWNER);
    auto leg = leafDefinition("Leg", 4.0, wood, 0.3);
    leg.amountInParent.reset();

    const int before = counting->calls;
    EXPECT_THROW(builder->addComponent(root, leg), CompositionError);
    EXPECT_EQ(counting->calls, before);
}

TEST_F(CompositionBuilderTest, AddComponentDeclaringParentIdIsCycle) {
    const NodeId root = builder->createComposition(chairDefinition(foam), OWNER);
    const NodeId seat = backend.nodes->get(root)->components[0];

    auto sub = leafDefinition("Spring", 5.0, steel, 0.05);
    sub.declaredId = seat;

    EXPECT_THROW(builder->addComponent(seat, sub), CycleError);

    auto nested = chairDefinition(foam);
    nested.amountInParent = 1.0;
    nested.components[0].components[0].declaredId = root;
    EXPECT_THROW(builder->addComponent(seat, nested), CycleError);

    EXPECT_EQ(count("composition_nodes"), 3);
}
