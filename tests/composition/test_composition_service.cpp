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
 * test_composition_service.cpp
 *
 * Tests for CompositionService
 * - End-to-end create, query and aggregate
 * - Subtree deletion cascades and later lookups are NotFound
 * - Deletion refuses to empty a parent; post-delete hook behaviour
 * - Scalar updates and their rules
 * - Bill-of-materials line maintenance
 * - Physical properties
 * - Stored subtree re-validation
 * - Brand listing
 * - Wiring a service from a configuration document
 */

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <vector>

#include "composition/errors.hpp"
#include "composition/composition.hpp"
#include "config/config_loader.hpp"
#include "composition_fixture.hpp"

using namespace teardown;
using namespace teardown::composition;
using namespace teardown::composition::test;

class CompositionServiceTest : public CompositionFixture {
protected:
    void SetUp() override {
        CompositionFixture::SetUp();
        service = std::make_unique<CompositionService>(
            backend.nodes, backend.catalog, backend.catalog, backend.catalog);
        chair = service->createComposition(chairDefinition(foam), OWNER);
        seat = service->getNode(chair).components[0];
        cushion = service->getNode(seat).components[0];
    }

    std::unique_ptr<CompositionService> service;
    NodeId chair = 0;
    NodeId seat = 0;
    NodeId cushion = 0;
};

// ==================== Trees ====================

TEST_F(CompositionServiceTest, ChairAggregatesToThree) {
    const auto totals = service->aggregateBillOfMaterials(chair);
    ASSERT_EQ(totals.size(), 1u);
    EXPECT_DOUBLE_EQ(totals.at(foam).quantity, 3.0);
}

TEST_F(CompositionServiceTest, SubtreeDepthFromSettings) {
    config::CompositionConfig settings;
    settings.maxSubtreeDepth = 2;
    CompositionService limited(backend.nodes, backend.catalog, backend.catalog,
                               backend.catalog, settings);

    EXPECT_NO_THROW((void)limited.getSubtree(RootSelector{chair}, 2));
    EXPECT_THROW((void)limited.getSubtree(RootSelector{chair}, 3),
                 atom::error::InvalidArgument);
}

TEST_F(CompositionServiceTest, AddComponentThenAggregate) {
    service->addComponent(chair,
                          leafDefinition("Leg", 4.0, wood, 250, Unit::Gram));
    const auto totals = service->aggregateBillOfMaterials(chair);
    EXPECT_DOUBLE_EQ(totals.at(wood).quantity, 1.0);
    EXPECT_EQ(totals.at(wood).unit, Unit::Kilogram);
}

TEST_F(CompositionServiceTest, DeleteRootCascades) {
    PhysicalProperties props;
    props.weightKg = 0.4;
    service->setPhysicalProperties(cushion, props);

    const auto removed = service->deleteSubtree(chair);
    EXPECT_EQ(removed.size(), 3u);
    EXPECT_EQ(removed.front(), chair);

    EXPECT_THROW((void)service->getNode(seat), NotFoundError);
    EXPECT_THROW((void)service->getNode(cushion), NotFoundError);
    EXPECT_THROW((void)service->aggregateBillOfMaterials(chair),
                 NotFoundError);
    EXPECT_EQ(count("bill_of_materials"), 0);
    EXPECT_EQ(count("physical_properties"), 0);
}

TEST_F(CompositionServiceTest, DeleteMissingIsNotFound) {
    EXPECT_THROW(service->deleteSubtree(999), NotFoundError);
}

TEST_F(CompositionServiceTest, DeleteOnlyChildOfBomlessParentRefused) {
    EXPECT_THROW(service->deleteSubtree(cushion), CompositionError);
    EXPECT_TRUE(backend.nodes->exists(cushion));
}

TEST_F(CompositionServiceTest, DeleteOneOfSeveralChildren) {
    const NodeId leg =
        service->addComponent(chair, leafDefinition("Leg", 4.0, wood, 0.3));
    const auto removed = service->deleteSubtree(leg);
    EXPECT_EQ(removed, std::vector<NodeId>{leg});
    EXPECT_EQ(service->getNode(chair).components, std::vector<NodeId>{seat});
}

TEST_F(CompositionServiceTest, PostDeleteHookReceivesRemovedIds) {
    std::vector<NodeId> seen;
    service->setPostDeleteHook(
        [&](const std::vector<NodeId>& ids) { seen = ids; });

    service->deleteSubtree(chair);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen.front(), chair);
}

TEST_F(CompositionServiceTest, PostDeleteHookFailureIsNotRethrown) {
    service->setPostDeleteHook([](const std::vector<NodeId>&) {
        throw std::runtime_error("attachment store offline");
    });

    EXPECT_NO_THROW(service->deleteSubtree(chair));
    EXPECT_FALSE(backend.nodes->exists(chair));
}

TEST_F(CompositionServiceTest, ValidateSubtree) {
    EXPECT_NO_THROW(service->validateSubtree(chair));
    EXPECT_THROW(service->validateSubtree(4040), NotFoundError);

    backend.database->execute("DELETE FROM bill_of_materials");
    EXPECT_THROW(service->validateSubtree(chair), ValidationError);
}

// ==================== Updates ====================

TEST_F(CompositionServiceTest, UpdateScalars) {
    NodeUpdate update;
    update.name = "Armchair";
    update.brand = "Nordic";
    update.description = "Oak frame";
    const auto updated = service->updateNode(chair, update);

    EXPECT_EQ(updated.details.name, "Armchair");
    EXPECT_EQ(updated.details.brand, "Nordic");

    NodeUpdate clear;
    clear.description = "";
    EXPECT_FALSE(service->updateNode(chair, clear).details.description);
}

TEST_F(CompositionServiceTest, UpdateAmountRules) {
    NodeUpdate update;
    update.amountInParent = 5.0;
    EXPECT_THROW(service->updateNode(chair, update), CompositionError);

    EXPECT_EQ(service->updateNode(seat, update).amountInParent, 5.0);

    update.amountInParent = 0.0;
    EXPECT_THROW(service->updateNode(seat, update), CompositionError);

    update.amountInParent = std::numeric_limits<double>::infinity();
    EXPECT_THROW(service->updateNode(seat, update), CompositionError);
    EXPECT_NO_THROW(service->validateSubtree(chair));

    EXPECT_DOUBLE_EQ(service->aggregateBillOfMaterials(chair).at(foam).quantity,
                     7.5);
}

TEST_F(CompositionServiceTest, UpdateFieldLimits) {
    NodeUpdate update;
    update.name = "X";
    EXPECT_THROW(service->updateNode(chair, update), FieldError);

    NodeUpdate times;
    times.dismantlingTimeEnd = Timestamp{std::chrono::seconds{1}};
    EXPECT_THROW(service->updateNode(chair, times), FieldError);
}

TEST_F(CompositionServiceTest, UpdateProductType) {
    NodeUpdate update;
    update.productTypeId = 77;
    EXPECT_THROW(service->updateNode(chair, update), NotFoundError);

    update.productTypeId = backend.catalog->addProductType("Seating");
    EXPECT_EQ(service->updateNode(chair, update).productTypeId,
              update.productTypeId);
}

TEST_F(CompositionServiceTest, UpdateMissingNode) {
    NodeUpdate update;
    update.name = "Ghost";
    EXPECT_THROW(service->updateNode(555, update), NotFoundError);
}

// ==================== Bill of materials ====================

TEST_F(CompositionServiceTest, AddMaterials) {
    const std::vector<MaterialLine> lines{{steel, 0.2, Unit::Kilogram},
                                          {wood, 30.0, Unit::Centimeter}};
    const auto node = service->addMaterials(cushion, lines);
    EXPECT_EQ(node.billOfMaterials.size(), 3u);
    EXPECT_EQ(node.billOfMaterials[2].unit, Unit::Centimeter);
}

TEST_F(CompositionServiceTest, AddMaterialsRejectsDuplicates) {
    const std::vector<MaterialLine> existing{{foam, 1.0, Unit::Kilogram}};
    EXPECT_THROW(service->addMaterials(cushion, existing), CompositionError);

    const std::vector<MaterialLine> repeated{{steel, 1.0, Unit::Kilogram},
                                             {steel, 2.0, Unit::Kilogram}};
    EXPECT_THROW(service->addMaterials(cushion, repeated), CompositionError);
    EXPECT_EQ(service->getNode(cushion).billOfMaterials.size(), 1u);
}

TEST_F(CompositionServiceTest, AddMaterialsRejectsUnknownAndNonPositive) {
    const std::vector<MaterialLine> unknown{{9001, 1.0, Unit::Kilogram}};
    EXPECT_THROW(service->addMaterials(cushion, unknown), NotFoundError);

    const std::vector<MaterialLine> zero{{steel, 0.0, Unit::Kilogram}};
    EXPECT_THROW(service->addMaterials(cushion, zero), FieldError);
}

TEST_F(CompositionServiceTest, UpdateMaterial) {
    const auto node =
        service->updateMaterial(cushion, foam, 750.0, Unit::Gram);
    ASSERT_EQ(node.billOfMaterials.size(), 1u);
    EXPECT_EQ(node.billOfMaterials[0], (MaterialLine{foam, 750.0, Unit::Gram}));

    EXPECT_THROW(service->updateMaterial(cushion, steel, 1.0, std::nullopt),
                 NotFoundError);
    EXPECT_THROW(service->updateMaterial(cushion, foam, -1.0, std::nullopt),
                 FieldError);
}

TEST_F(CompositionServiceTest, RemoveMaterials) {
    const std::vector<MaterialLine> extra{{steel, 0.1, Unit::Kilogram}};
    service->addMaterials(cushion, extra);

    const std::vector<MaterialId> remove{steel};
    const auto node = service->removeMaterials(cushion, remove);
    EXPECT_EQ(node.billOfMaterials.size(), 1u);
}

TEST_F(CompositionServiceTest, RemovingLastMaterialOfLeafRefused) {
    const std::vector<MaterialId> remove{foam};
    EXPECT_THROW(service->removeMaterials(cushion, remove), IncompleteBomError);

    const std::vector<MaterialId> absent{steel};
    EXPECT_THROW(service->removeMaterials(cushion, absent), NotFoundError);
}

TEST_F(CompositionServiceTest, InnerNodeMayDropAllMaterials) {
    const std::vector<MaterialLine> lines{{steel, 1.0, Unit::Kilogram}};
    service->addMaterials(seat, lines);

    const std::vector<MaterialId> remove{steel};
    EXPECT_TRUE(
        service->removeMaterials(seat, remove).billOfMaterials.empty());
}

// ==================== Physical properties ====================

TEST_F(CompositionServiceTest, PhysicalPropertiesLifecycle) {
    EXPECT_THROW((void)service->getPhysicalProperties(seat), NotFoundError);

    PhysicalProperties props;
    props.heightCm = 10.0;
    props.widthCm = 20.0;
    props.depthCm = 5.0;
    service->setPhysicalProperties(seat, props);

    const auto stored = service->getPhysicalProperties(seat);
    EXPECT_EQ(stored.volumeCm3(), 1000.0);

    service->removePhysicalProperties(seat);
    EXPECT_THROW(service->removePhysicalProperties(seat), NotFoundError);
}

TEST_F(CompositionServiceTest, PhysicalPropertiesValidated) {
    PhysicalProperties props;
    props.weightKg = -3.0;
    EXPECT_THROW(service->setPhysicalProperties(seat, props), FieldError);
    EXPECT_THROW(service->setPhysicalProperties(808, PhysicalProperties{}),
                 NotFoundError);
}

// ==================== Brands ====================

TEST_F(CompositionServiceTest, ListBrandsNormalizes) {
    const std::vector<std::pair<NodeId, std::string>> brands{
        {chair, "  ikea "}, {seat, "IKEA"}, {cushion, "acme corp"}};
    for (const auto& [id, brand] : brands) {
        NodeUpdate update;
        update.brand = brand;
        service->updateNode(id, update);
    }

    EXPECT_EQ(service->listBrands(),
              (std::vector<std::string>{"Acme Corp", "Ikea"}));
}

TEST(NormalizeBrandTest, TitleCase) {
    EXPECT_EQ(normalizeBrand("  hewlett-packard "), "Hewlett-Packard");
    EXPECT_EQ(normalizeBrand("3m"), "3M");
    EXPECT_EQ(normalizeBrand("   "), "");
}

// ==================== Wiring ====================

TEST(CompositionWiringTest, ServiceFromConfigurationDocument) {
    const auto settings = config::ConfigLoader::fromString(R"({
        "teardown": {
            "store": {"databasePath": ":memory:"},
            "composition": {"maxSubtreeDepth": 3, "unitPolicy": "raw"}
        }
    })");

    auto backend = SqliteBackend::open(settings.store);
    backend.catalog->addOwner("owner-2");
    const auto foam = backend.catalog->addMaterial("Foam");

    CompositionService service(backend.nodes, backend.catalog, backend.catalog,
                               backend.catalog, settings.composition);
    EXPECT_EQ(service.settings().maxSubtreeDepth, 3);
    EXPECT_EQ(service.settings().unitPolicy, config::UnitPolicy::Raw);

    const NodeId chair =
        service.createComposition(chairDefinition(foam), "owner-2");
    EXPECT_THROW((void)service.getSubtree(RootSelector{chair}, 4),
                 atom::error::InvalidArgument);
    EXPECT_DOUBLE_EQ(service.aggregateBillOfMaterials(chair).at(foam).quantity,
                     3.0);
}
