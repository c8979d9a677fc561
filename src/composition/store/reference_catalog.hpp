// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_STORE_REFERENCE_CATALOG_HPP
#define TEARDOWN_COMPOSITION_STORE_REFERENCE_CATALOG_HPP

#include <expected>
#include <span>
#include <vector>

#include "../model/types.hpp"

namespace teardown::composition {

/**
 * @brief Existence checks for the actors that own composition trees
 */
class IOwnerDirectory {
public:
    virtual ~IOwnerDirectory() = default;
    [[nodiscard]] virtual auto exists(const OwnerId& ownerId) -> bool = 0;
};

class IProductTypeCatalog {
public:
    virtual ~IProductTypeCatalog() = default;
    [[nodiscard]] virtual auto exists(ProductTypeId productTypeId)
        -> bool = 0;
};

class IMaterialCatalog {
public:
    virtual ~IMaterialCatalog() = default;

    /**
     * @brief Check a batch of material ids in one round trip
     * @return The ids that do not exist, sorted and without duplicates
     */
    [[nodiscard]] virtual auto existAll(std::span<const MaterialId> ids)
        -> std::expected<void, std::vector<MaterialId>> = 0;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_STORE_REFERENCE_CATALOG_HPP
