// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_STORE_SQLITE_REFERENCE_CATALOG_HPP
#define TEARDOWN_COMPOSITION_STORE_SQLITE_REFERENCE_CATALOG_HPP

#include <memory>
#include <optional>
#include <string>

#include "database/database.hpp"
#include "reference_catalog.hpp"

namespace teardown::composition {

/**
 * @brief Owners, product types and materials kept in the same database as
 * the nodes
 *
 * The seeding calls exist so that a standalone deployment (and the tests)
 * can populate the reference tables; in a larger system these tables are
 * maintained elsewhere.
 */
class SqliteReferenceCatalog : public IOwnerDirectory,
                               public IProductTypeCatalog,
                               public IMaterialCatalog {
public:
    explicit SqliteReferenceCatalog(
        std::shared_ptr<database::core::Database> db);

    [[nodiscard]] auto exists(const OwnerId& ownerId) -> bool override;
    [[nodiscard]] auto exists(ProductTypeId productTypeId) -> bool override;
    [[nodiscard]] auto existAll(std::span<const MaterialId> ids)
        -> std::expected<void, std::vector<MaterialId>> override;

    /**
     * @throws IntegrityError if the owner id is taken
     */
    void addOwner(const OwnerId& ownerId,
                  const std::optional<std::string>& displayName = std::nullopt);

    /**
     * @return The new product type id
     * @throws IntegrityError if the name is taken
     */
    auto addProductType(const std::string& name,
                        const std::optional<std::string>& description =
                            std::nullopt) -> ProductTypeId;

    /**
     * @return The new material id
     * @throws IntegrityError if the name is taken
     */
    auto addMaterial(const std::string& name,
                     const std::optional<std::string>& description =
                         std::nullopt) -> MaterialId;

private:
    std::shared_ptr<database::core::Database> db_;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_STORE_SQLITE_REFERENCE_CATALOG_HPP
