// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_STORE_SQLITE_BACKEND_HPP
#define TEARDOWN_COMPOSITION_STORE_SQLITE_BACKEND_HPP

#include <memory>

#include "config/sections/store_config.hpp"
#include "sqlite_node_store.hpp"
#include "sqlite_reference_catalog.hpp"

namespace teardown::composition {

/**
 * @brief One SQLite connection with the node store and reference catalog
 * built on it
 */
struct SqliteBackend {
    std::shared_ptr<database::core::Database> database;
    std::shared_ptr<SqliteNodeStore> nodes;
    std::shared_ptr<SqliteReferenceCatalog> catalog;

    /**
     * @brief Open the configured database, apply its pragmas and busy
     * timeout, and create the schema
     *
     * @throws DatabaseOpenError if the file cannot be opened
     * @throws SqlExecutionError if a pragma or the schema fails
     */
    static auto open(const config::StoreConfig& config) -> SqliteBackend;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_STORE_SQLITE_BACKEND_HPP
