// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include "sqlite_backend.hpp"

#include <spdlog/spdlog.h>

namespace teardown::composition {

auto SqliteBackend::open(const config::StoreConfig& config) -> SqliteBackend {
    SqliteBackend backend;
    backend.database =
        std::make_shared<database::core::Database>(config.databasePath);
    backend.database->setBusyTimeout(config.busyTimeoutMs);
    if (!config.pragmas.empty()) {
        backend.database->configure(config.pragmas);
    }

    backend.catalog = std::make_shared<SqliteReferenceCatalog>(backend.database);
    backend.nodes = std::make_shared<SqliteNodeStore>(backend.database);

    spdlog::info("Opened composition store at '{}'", config.databasePath);
    return backend;
}

}  // namespace teardown::composition
