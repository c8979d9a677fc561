// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include "schema.hpp"

#include <spdlog/spdlog.h>

namespace teardown::composition {

namespace {

constexpr const char* REFERENCE_TABLES = R"(
    CREATE TABLE IF NOT EXISTS owners (
        id TEXT PRIMARY KEY,
        display_name TEXT
    );

    CREATE TABLE IF NOT EXISTS product_types (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        name TEXT NOT NULL UNIQUE,
        description TEXT
    );

    CREATE TABLE IF NOT EXISTS materials (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        name TEXT NOT NULL UNIQUE,
        description TEXT
    );
)";

// A root has no amount; every child has a positive one
constexpr const char* COMPOSITION_TABLES = R"(
    CREATE TABLE IF NOT EXISTS composition_nodes (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        parent_id INTEGER REFERENCES composition_nodes(id) ON DELETE CASCADE,
        position INTEGER NOT NULL DEFAULT 0,
        amount_in_parent REAL,
        owner_id TEXT NOT NULL REFERENCES owners(id),
        product_type_id INTEGER REFERENCES product_types(id) ON DELETE SET NULL,
        name TEXT NOT NULL,
        description TEXT,
        brand TEXT,
        model TEXT,
        dismantling_notes TEXT,
        dismantling_time_start INTEGER NOT NULL,
        dismantling_time_end INTEGER,
        created_at INTEGER NOT NULL,
        updated_at INTEGER NOT NULL,
        CHECK ((parent_id IS NULL AND amount_in_parent IS NULL) OR
               (parent_id IS NOT NULL AND amount_in_parent > 0)),
        CHECK (dismantling_time_end IS NULL OR
               dismantling_time_end >= dismantling_time_start)
    );

    CREATE INDEX IF NOT EXISTS idx_composition_nodes_parent
        ON composition_nodes(parent_id, position);
    CREATE INDEX IF NOT EXISTS idx_composition_nodes_owner
        ON composition_nodes(owner_id);

    CREATE TABLE IF NOT EXISTS bill_of_materials (
        node_id INTEGER NOT NULL
            REFERENCES composition_nodes(id) ON DELETE CASCADE,
        material_id INTEGER NOT NULL REFERENCES materials(id),
        quantity REAL NOT NULL CHECK (quantity > 0),
        unit TEXT NOT NULL DEFAULT 'kg' CHECK (unit IN ('kg', 'g', 'm', 'cm')),
        position INTEGER NOT NULL DEFAULT 0,
        PRIMARY KEY (node_id, material_id)
    );

    CREATE INDEX IF NOT EXISTS idx_bill_of_materials_material
        ON bill_of_materials(material_id);

    CREATE TABLE IF NOT EXISTS physical_properties (
        node_id INTEGER PRIMARY KEY
            REFERENCES composition_nodes(id) ON DELETE CASCADE,
        weight_kg REAL CHECK (weight_kg IS NULL OR weight_kg > 0),
        height_cm REAL CHECK (height_cm IS NULL OR height_cm > 0),
        width_cm REAL CHECK (width_cm IS NULL OR width_cm > 0),
        depth_cm REAL CHECK (depth_cm IS NULL OR depth_cm > 0)
    );

    CREATE TABLE IF NOT EXISTS node_videos (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        node_id INTEGER NOT NULL
            REFERENCES composition_nodes(id) ON DELETE CASCADE,
        url TEXT NOT NULL,
        title TEXT NOT NULL DEFAULT '',
        description TEXT
    );

    CREATE INDEX IF NOT EXISTS idx_node_videos_node ON node_videos(node_id);
)";

}  // namespace

void applySchema(database::core::Database& db) {
    try {
        db.execute(REFERENCE_TABLES);
        db.execute(COMPOSITION_TABLES);
        SPDLOG_DEBUG("Composition schema ready");
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Failed to create composition schema: {}", e.what());
        throw;
    }
}

}  // namespace teardown::composition
