// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_STORE_SCHEMA_HPP
#define TEARDOWN_COMPOSITION_STORE_SCHEMA_HPP

#include "database/core/database.hpp"

namespace teardown::composition {

/**
 * @brief Create the composition and reference tables if they are missing
 *
 * Safe to call on every start and from every component that shares the
 * connection.
 */
void applySchema(database::core::Database& db);

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_STORE_SCHEMA_HPP
