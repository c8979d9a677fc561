// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include "sqlite_reference_catalog.hpp"

#include <algorithm>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "../errors.hpp"
#include "schema.hpp"

namespace teardown::composition {

namespace {

// Stays well below SQLITE_MAX_VARIABLE_NUMBER on old builds
constexpr size_t EXISTS_CHUNK = 500;

auto placeholders(size_t count) -> std::string {
    std::string text;
    text.reserve(count * 2);
    for (size_t i = 0; i < count; ++i) {
        text += i == 0 ? "?" : ",?";
    }
    return text;
}

auto conflictContext(std::string entity, const std::string& key)
    -> ErrorContext {
    ErrorContext context;
    context.entity = std::move(entity);
    context.constraint = "unique";
    context.missingIds = {key};
    return context;
}

}  // namespace

SqliteReferenceCatalog::SqliteReferenceCatalog(
    std::shared_ptr<database::core::Database> db)
    : db_(std::move(db)) {
    if (!db_ || !db_->isValid()) {
        THROW_VALIDATION_ERROR("SqliteReferenceCatalog needs an open database");
    }
    applySchema(*db_);
}

auto SqliteReferenceCatalog::exists(const OwnerId& ownerId) -> bool {
    auto stmt = db_->prepare("SELECT 1 FROM owners WHERE id = ?");
    stmt->bind(1, ownerId);
    return stmt->step();
}

auto SqliteReferenceCatalog::exists(ProductTypeId productTypeId) -> bool {
    auto stmt = db_->prepare("SELECT 1 FROM product_types WHERE id = ?");
    stmt->bind(1, productTypeId);
    return stmt->step();
}

auto SqliteReferenceCatalog::existAll(std::span<const MaterialId> ids)
    -> std::expected<void, std::vector<MaterialId>> {
    std::vector<MaterialId> wanted(ids.begin(), ids.end());
    std::sort(wanted.begin(), wanted.end());
    wanted.erase(std::unique(wanted.begin(), wanted.end()), wanted.end());

    std::unordered_set<MaterialId> found;
    for (size_t offset = 0; offset < wanted.size(); offset += EXISTS_CHUNK) {
        const size_t count = std::min(EXISTS_CHUNK, wanted.size() - offset);
        auto stmt = db_->prepare("SELECT id FROM materials WHERE id IN (" +
                                 placeholders(count) + ")");
        for (size_t i = 0; i < count; ++i) {
            stmt->bind(static_cast<int>(i + 1), wanted[offset + i]);
        }
        while (stmt->step()) {
            found.insert(stmt->getInt64(0));
        }
    }

    std::vector<MaterialId> missing;
    for (MaterialId id : wanted) {
        if (!found.contains(id)) {
            missing.push_back(id);
        }
    }
    if (!missing.empty()) {
        SPDLOG_DEBUG("{} of {} materials are unknown", missing.size(),
                     wanted.size());
        return std::unexpected(std::move(missing));
    }
    return {};
}

void SqliteReferenceCatalog::addOwner(
    const OwnerId& ownerId, const std::optional<std::string>& displayName) {
    auto stmt =
        db_->prepare("INSERT INTO owners (id, display_name) VALUES (?, ?)");
    stmt->bind(1, ownerId);
    stmt->bindOptional(2, displayName);
    try {
        stmt->execute();
    } catch (const database::core::ConstraintViolationError&) {
        THROW_INTEGRITY_ERROR(conflictContext("owner", ownerId),
                              "Owner '" + ownerId + "' already exists");
    }
}

auto SqliteReferenceCatalog::addProductType(
    const std::string& name, const std::optional<std::string>& description)
    -> ProductTypeId {
    auto stmt = db_->prepare(
        "INSERT INTO product_types (name, description) VALUES (?, ?)");
    stmt->bind(1, name);
    stmt->bindOptional(2, description);
    try {
        stmt->execute();
    } catch (const database::core::ConstraintViolationError&) {
        THROW_INTEGRITY_ERROR(conflictContext("product type", name),
                              "Product type '" + name + "' already exists");
    }
    return db_->lastInsertRowId();
}

auto SqliteReferenceCatalog::addMaterial(
    const std::string& name, const std::optional<std::string>& description)
    -> MaterialId {
    auto stmt =
        db_->prepare("INSERT INTO materials (name, description) VALUES (?, ?)");
    stmt->bind(1, name);
    stmt->bindOptional(2, description);
    try {
        stmt->execute();
    } catch (const database::core::ConstraintViolationError&) {
        THROW_INTEGRITY_ERROR(conflictContext("material", name),
                              "Material '" + name + "' already exists");
    }
    const MaterialId id = db_->lastInsertRowId();
    SPDLOG_DEBUG("Registered material {} '{}'", id, name);
    return id;
}

}  // namespace teardown::composition
