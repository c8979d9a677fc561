// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_HPP
#define TEARDOWN_COMPOSITION_HPP

/**
 * @file composition.hpp
 * @brief Facade header for the composition module.
 *
 * @par Usage Example:
 * @code
 * #include "composition/composition.hpp"
 *
 * using namespace teardown;
 *
 * config::StoreConfig store;
 * store.databasePath = ":memory:";
 * auto backend = composition::SqliteBackend::open(store);
 *
 * composition::CompositionService service(backend.nodes, backend.catalog,
 *                                         backend.catalog, backend.catalog);
 * auto rootId = service.createComposition(chair, "owner-1");
 * auto totals = service.aggregateBillOfMaterials(rootId);
 * @endcode
 */

#include "bom/bom_aggregator.hpp"
#include "builder/composition_builder.hpp"
#include "errors.hpp"
#include "model/composition_node.hpp"
#include "model/node_index.hpp"
#include "model/tree_definition.hpp"
#include "model/tree_view.hpp"
#include "model/types.hpp"
#include "model/units.hpp"
#include "query/subtree_query_service.hpp"
#include "service/composition_service.hpp"
#include "store/node_store.hpp"
#include "store/reference_catalog.hpp"
#include "store/sqlite_backend.hpp"
#include "validator/tree_invariant_validator.hpp"

#endif  // TEARDOWN_COMPOSITION_HPP
