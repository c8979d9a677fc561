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
 * test_subtree_query_service.cpp
 *
 * Tests for SubtreeQueryService
 * - Depth 1 populates exactly one level of components
 * - Deeper bounds and stored trees shallower than the bound
 * - AllRoots selects every parent-less node
 * - Depth outside the configured range is an invalid argument
 * - Unknown roots are NotFound
 */

#include <gtest/gtest.h>

#include "atom/error/exception.hpp"
#include "composition/builder/composition_builder.hpp"
#include "composition/errors.hpp"
#include "composition/query/subtree_query_service.hpp"
#include "composition_fixture.hpp"

using namespace teardown::composition;
using namespace teardown::composition::test;

class SubtreeQueryServiceTest : public CompositionFixture {
protected:
    void SetUp() override {
        CompositionFixture::SetUp();
        builder = std::make_unique<CompositionBuilder>(
            *backend.nodes, *backend.catalog, *backend.catalog,
            *backend.catalog);
        query = std::make_unique<SubtreeQueryService>(*backend.nodes);
        chair = builder->createComposition(chairDefinition(foam), OWNER);
    }

    std::unique_ptr<CompositionBuilder> builder;
    std::unique_ptr<SubtreeQueryService> query;
    NodeId chair = 0;
};

TEST_F(SubtreeQueryServiceTest, DepthOneStopsAfterFirstLevel) {
    const auto view = query->getSubtree(RootSelector{chair}, 1);

    EXPECT_EQ(view.maxDepth, 1);
    ASSERT_EQ(view.roots.size(), 1u);
    const auto& root = view.roots[0];
    EXPECT_EQ(root.id, chair);
    ASSERT_EQ(root.components.size(), 1u);
    EXPECT_EQ(root.components[0].details.name, "Seat");
    EXPECT_TRUE(root.components[0].components.empty());
}

TEST_F(SubtreeQueryServiceTest, DepthTwoReachesLeaves) {
    const auto view = query->getSubtree(RootSelector{chair}, 2);

    const auto& seat = view.roots[0].components[0];
    ASSERT_EQ(seat.components.size(), 1u);
    const auto& cushion = seat.components[0];
    EXPECT_EQ(cushion.details.name, "Cushion");
    EXPECT_EQ(cushion.amountInParent, 3.0);
    ASSERT_EQ(cushion.billOfMaterials.size(), 1u);
    EXPECT_EQ(cushion.billOfMaterials[0].materialId, foam);
}

TEST_F(SubtreeQueryServiceTest, BoundDeeperThanTree) {
    const auto view = query->getSubtree(RootSelector{chair}, 5);
    const auto& cushion = view.roots[0].components[0].components[0];
    EXPECT_TRUE(cushion.components.empty());
}

TEST_F(SubtreeQueryServiceTest, InnerNodeAsRoot) {
    const NodeId seat = backend.nodes->get(chair)->components[0];
    const auto view = query->getSubtree(RootSelector{seat}, 1);

    ASSERT_EQ(view.roots.size(), 1u);
    EXPECT_EQ(view.roots[0].parentId, chair);
    EXPECT_EQ(view.roots[0].components.size(), 1u);
}

TEST_F(SubtreeQueryServiceTest, AllRootsSelectsEveryBaseProduct) {
    TreeDefinition lamp;
    lamp.details.name = "Lamp";
    lamp.billOfMaterials.push_back({steel, 0.7, Unit::Kilogram});
    const NodeId lampId = builder->createComposition(lamp, OWNER);

    const auto view = query->getSubtree(AllRoots{}, 1);
    ASSERT_EQ(view.roots.size(), 2u);
    EXPECT_EQ(view.roots[0].id, chair);
    EXPECT_EQ(view.roots[1].id, lampId);
    EXPECT_TRUE(view.roots[0].components[0].components.empty());
}

TEST_F(SubtreeQueryServiceTest, AllRootsOnEmptyStore) {
    backend.nodes->deleteSubtree(chair);
    EXPECT_TRUE(query->getSubtree(AllRoots{}, 3).roots.empty());
}

TEST_F(SubtreeQueryServiceTest, DepthOutOfRangeIsInvalidArgument) {
    EXPECT_THROW((void)query->getSubtree(RootSelector{chair}, 0),
                 atom::error::InvalidArgument);
    EXPECT_THROW((void)query->getSubtree(RootSelector{chair}, 6),
                 atom::error::InvalidArgument);

    SubtreeQueryService limited(*backend.nodes, 2);
    EXPECT_NO_THROW((void)limited.getSubtree(RootSelector{chair}, 2));
    EXPECT_THROW((void)limited.getSubtree(RootSelector{chair}, 3),
                 atom::error::InvalidArgument);
}

TEST_F(SubtreeQueryServiceTest, UnknownRootIsNotFound) {
    EXPECT_THROW((void)query->getSubtree(RootSelector{NodeId{31337}}, 2),
                 NotFoundError);
}

TEST(SubtreeViewTest, BuildViewTruncatesAtDepth) {
    NodeIndex index;
    for (NodeId id = 1; id <= 4; ++id) {
        CompositionNode node;
        node.id = id;
        if (id > 1) {
            node.parentId = id - 1;
            node.amountInParent = 1.0;
        }
        if (id < 4) {
            node.components = {id + 1};
        }
        index.add(node);
    }
    index.addRoot(1);

    const auto view = SubtreeQueryService::buildView(index, 2);
    const auto& level2 = view.roots[0].components[0].components[0];
    EXPECT_EQ(level2.id, 3);
    EXPECT_TRUE(level2.components.empty());
}
