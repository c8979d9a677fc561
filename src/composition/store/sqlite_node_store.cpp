// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include "sqlite_node_store.hpp"

#include <algorithm>
#include <string>
#include <variant>

#include <spdlog/spdlog.h>

#include "../errors.hpp"
#include "schema.hpp"

namespace teardown::composition {

using database::core::ConstraintViolationError;
using database::core::Statement;

namespace {

constexpr const char* NODE_COLUMNS =
    "n.id, n.parent_id, n.amount_in_parent, n.owner_id, n.product_type_id, "
    "n.name, n.description, n.brand, n.model, n.dismantling_notes, "
    "n.dismantling_time_start, n.dismantling_time_end, n.created_at, "
    "n.updated_at";

auto toSeconds(Timestamp t) -> int64_t { return t.time_since_epoch().count(); }

auto fromSeconds(int64_t s) -> Timestamp {
    return Timestamp{std::chrono::seconds{s}};
}

auto storedUnit(NodeId nodeId, const std::string& text) -> Unit {
    auto unit = unitFromString(text);
    if (!unit) {
        THROW_INVARIANT_VIOLATION_ERROR(
            nodeContext(nodeId, "unit"),
            "Stored unit '" + text + "' is not recognised");
    }
    return *unit;
}

/**
 * @brief Run a write and report constraint failures as IntegrityError
 */
template <typename Fn>
auto withIntegrity(const ErrorContext& context, const char* operation,
                   Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const ConstraintViolationError& e) {
        SPDLOG_WARN("{} rejected by constraint: {}", operation, e.what());
        THROW_INTEGRITY_ERROR(context, std::string(operation) +
                                           " violates a constraint: " +
                                           e.what());
    }
}

/**
 * @brief Recursive CTE named `subtree(id)` over the forest under @p selector
 *
 * Parameters: ?1 is the root id (NodeId selectors), ?2 the depth bound
 * (bounded form).
 */
auto subtreeCte(const RootSelector& selector, bool bounded) -> std::string {
    const std::string rootCondition = std::holds_alternative<NodeId>(selector)
                                          ? "id = ?1"
                                          : "parent_id IS NULL";
    if (bounded) {
        return "WITH RECURSIVE walk(id, depth) AS ("
               "  SELECT id, 0 FROM composition_nodes WHERE " +
               rootCondition +
               "  UNION ALL"
               "  SELECT c.id, w.depth + 1 FROM composition_nodes c"
               "  JOIN walk w ON c.parent_id = w.id WHERE w.depth < ?2"
               "), subtree(id) AS (SELECT DISTINCT id FROM walk) ";
    }
    return "WITH RECURSIVE subtree(id) AS ("
           "  SELECT id FROM composition_nodes WHERE " +
           rootCondition +
           "  UNION"
           "  SELECT c.id FROM composition_nodes c"
           "  JOIN subtree s ON c.parent_id = s.id"
           ") ";
}

void bindSubtreeParams(Statement& stmt, const RootSelector& selector,
                       std::optional<int> maxDepth) {
    if (const auto* id = std::get_if<NodeId>(&selector)) {
        stmt.bind(1, *id);
    }
    if (maxDepth) {
        stmt.bind(2, *maxDepth);
    }
}

}  // namespace

// ============================================================================
// Transactions
// ============================================================================

namespace {

class SqliteStoreTransaction : public StoreTransaction {
public:
    explicit SqliteStoreTransaction(
        std::unique_ptr<database::core::Transaction> txn)
        : txn_(std::move(txn)) {}

    void commit() override {
        try {
            txn_->commit();
        } catch (const ConstraintViolationError& e) {
            THROW_INTEGRITY_ERROR(ErrorContext{},
                                  std::string("Commit rejected: ") + e.what());
        }
    }

    void rollback() override { txn_->rollback(); }

private:
    std::unique_ptr<database::core::Transaction> txn_;
};

}  // namespace

SqliteNodeStore::SqliteNodeStore(std::shared_ptr<database::core::Database> db)
    : db_(std::move(db)) {
    if (!db_ || !db_->isValid()) {
        THROW_VALIDATION_ERROR("SqliteNodeStore needs an open database");
    }
    applySchema(*db_);
    SPDLOG_INFO("SqliteNodeStore initialized");
}

auto SqliteNodeStore::beginTransaction() -> std::unique_ptr<StoreTransaction> {
    return std::make_unique<SqliteStoreTransaction>(db_->beginTransaction());
}

// ============================================================================
// Reads
// ============================================================================

auto SqliteNodeStore::readNode(Statement& stmt) const -> CompositionNode {
    CompositionNode node;
    node.id = stmt.getInt64(0);
    node.parentId = stmt.getOptionalInt64(1);
    node.amountInParent = stmt.getOptionalDouble(2);
    node.ownerId = stmt.getText(3);
    node.productTypeId = stmt.getOptionalInt64(4);
    node.details.name = stmt.getText(5);
    node.details.description = stmt.getOptionalText(6);
    node.details.brand = stmt.getOptionalText(7);
    node.details.model = stmt.getOptionalText(8);
    node.details.dismantlingNotes = stmt.getOptionalText(9);
    node.details.dismantlingTimeStart = fromSeconds(stmt.getInt64(10));
    if (auto end = stmt.getOptionalInt64(11)) {
        node.details.dismantlingTimeEnd = fromSeconds(*end);
    }
    node.createdAt = fromSeconds(stmt.getInt64(12));
    node.updatedAt = fromSeconds(stmt.getInt64(13));
    return node;
}

auto SqliteNodeStore::get(NodeId id) -> std::optional<CompositionNode> {
    auto stmt = db_->prepare(std::string("SELECT ") + NODE_COLUMNS +
                             " FROM composition_nodes n WHERE n.id = ?");
    stmt->bind(1, id);
    if (!stmt->step()) {
        return std::nullopt;
    }
    auto node = readNode(*stmt);
    node.billOfMaterials = loadMaterials(id);
    node.components = loadChildIds(id);
    node.physicalProperties = loadPhysicalProperties(id);
    node.videos = loadVideos(id);
    return node;
}

auto SqliteNodeStore::exists(NodeId id) -> bool {
    auto stmt = db_->prepare("SELECT 1 FROM composition_nodes WHERE id = ?");
    stmt->bind(1, id);
    return stmt->step();
}

auto SqliteNodeStore::getChildren(NodeId id) -> std::vector<CompositionNode> {
    auto ids = loadChildIds(id);
    return getMany(ids);
}

auto SqliteNodeStore::getMany(std::span<const NodeId> ids)
    -> std::vector<CompositionNode> {
    std::vector<CompositionNode> nodes;
    nodes.reserve(ids.size());
    for (NodeId id : ids) {
        if (auto node = get(id)) {
            nodes.push_back(std::move(*node));
        }
    }
    return nodes;
}

auto SqliteNodeStore::loadChildIds(NodeId id) -> std::vector<NodeId> {
    auto stmt = db_->prepare(
        "SELECT id FROM composition_nodes WHERE parent_id = ? "
        "ORDER BY position, id");
    stmt->bind(1, id);
    std::vector<NodeId> ids;
    while (stmt->step()) {
        ids.push_back(stmt->getInt64(0));
    }
    return ids;
}

auto SqliteNodeStore::loadMaterials(NodeId id) -> std::vector<MaterialLine> {
    auto stmt = db_->prepare(
        "SELECT material_id, quantity, unit FROM bill_of_materials "
        "WHERE node_id = ? ORDER BY position, material_id");
    stmt->bind(1, id);
    std::vector<MaterialLine> lines;
    while (stmt->step()) {
        lines.push_back({stmt->getInt64(0), stmt->getDouble(1),
                         storedUnit(id, stmt->getText(2))});
    }
    return lines;
}

auto SqliteNodeStore::loadPhysicalProperties(NodeId id)
    -> std::optional<PhysicalProperties> {
    auto stmt = db_->prepare(
        "SELECT weight_kg, height_cm, width_cm, depth_cm "
        "FROM physical_properties WHERE node_id = ?");
    stmt->bind(1, id);
    if (!stmt->step()) {
        return std::nullopt;
    }
    PhysicalProperties props;
    props.weightKg = stmt->getOptionalDouble(0);
    props.heightCm = stmt->getOptionalDouble(1);
    props.widthCm = stmt->getOptionalDouble(2);
    props.depthCm = stmt->getOptionalDouble(3);
    return props;
}

auto SqliteNodeStore::loadVideos(NodeId id) -> std::vector<VideoLink> {
    auto stmt = db_->prepare(
        "SELECT url, title, description FROM node_videos "
        "WHERE node_id = ? ORDER BY id");
    stmt->bind(1, id);
    std::vector<VideoLink> videos;
    while (stmt->step()) {
        videos.push_back(
            {stmt->getText(0), stmt->getText(1), stmt->getOptionalText(2)});
    }
    return videos;
}

auto SqliteNodeStore::fetchForest(const RootSelector& selector,
                                  std::optional<int> maxDepth) -> NodeIndex {
    const auto cte = subtreeCte(selector, maxDepth.has_value());
    NodeIndex index;

    // Roots sort first, then siblings in insertion order
    auto nodes = db_->prepare(
        cte + "SELECT " + NODE_COLUMNS +
        " FROM composition_nodes n WHERE n.id IN (SELECT id FROM subtree) "
        "ORDER BY n.parent_id IS NOT NULL, n.parent_id, n.position, n.id");
    bindSubtreeParams(*nodes, selector, maxDepth);

    std::vector<std::pair<NodeId, NodeId>> links;
    while (nodes->step()) {
        auto node = readNode(*nodes);
        if (node.parentId) {
            links.emplace_back(*node.parentId, node.id);
        }
        index.add(std::move(node));
    }

    for (const auto& [parentId, childId] : links) {
        if (auto* parent = index.find(parentId)) {
            parent->components.push_back(childId);
        }
    }

    if (const auto* rootId = std::get_if<NodeId>(&selector)) {
        if (index.contains(*rootId)) {
            index.addRoot(*rootId);
        }
    } else {
        for (const auto& node : index.nodes()) {
            if (node.isRoot()) {
                index.addRoot(node.id);
            }
        }
    }

    if (index.empty()) {
        return index;
    }

    auto lines = db_->prepare(
        cte +
        "SELECT node_id, material_id, quantity, unit FROM bill_of_materials "
        "WHERE node_id IN (SELECT id FROM subtree) "
        "ORDER BY node_id, position, material_id");
    bindSubtreeParams(*lines, selector, maxDepth);
    while (lines->step()) {
        const NodeId nodeId = lines->getInt64(0);
        if (auto* node = index.find(nodeId)) {
            node->billOfMaterials.push_back(
                {lines->getInt64(1), lines->getDouble(2),
                 storedUnit(nodeId, lines->getText(3))});
        }
    }

    SPDLOG_DEBUG("Fetched forest of {} nodes (depth bound {})", index.size(),
                 maxDepth ? std::to_string(*maxDepth) : "none");
    return index;
}

auto SqliteNodeStore::listRootIds() -> std::vector<NodeId> {
    auto stmt = db_->prepare(
        "SELECT id FROM composition_nodes WHERE parent_id IS NULL "
        "ORDER BY id");
    std::vector<NodeId> ids;
    while (stmt->step()) {
        ids.push_back(stmt->getInt64(0));
    }
    return ids;
}

auto SqliteNodeStore::listBrands() -> std::vector<std::string> {
    auto stmt = db_->prepare(
        "SELECT DISTINCT brand FROM composition_nodes "
        "WHERE brand IS NOT NULL AND TRIM(brand) <> '' ORDER BY brand");
    std::vector<std::string> brands;
    while (stmt->step()) {
        brands.push_back(stmt->getText(0));
    }
    return brands;
}

auto SqliteNodeStore::subtreeIds(NodeId id) -> std::vector<NodeId> {
    auto stmt = db_->prepare(subtreeCte(NodeId{id}, false) +
                             "SELECT id FROM subtree");
    stmt->bind(1, id);
    std::vector<NodeId> ids;
    while (stmt->step()) {
        ids.push_back(stmt->getInt64(0));
    }
    return ids;
}

// ============================================================================
// Writes
// ============================================================================

auto SqliteNodeStore::insert(const CompositionNode& node) -> NodeId {
    ErrorContext context;
    context.nodePath = node.details.name;
    context.constraint = "composition_nodes";

    return withIntegrity(context, "Insert node", [&]() -> NodeId {
        auto stmt = db_->prepare(
            "INSERT INTO composition_nodes (parent_id, position, "
            "amount_in_parent, owner_id, product_type_id, name, description, "
            "brand, model, dismantling_notes, dismantling_time_start, "
            "dismantling_time_end, created_at, updated_at) VALUES (?1, "
            "COALESCE((SELECT MAX(position) + 1 FROM composition_nodes "
            "WHERE parent_id = ?1), 0), ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, "
            "?11, ?12, ?12)");

        const auto now = nowTimestamp();
        stmt->bindOptional(1, node.parentId);
        stmt->bindOptional(2, node.amountInParent);
        stmt->bind(3, node.ownerId);
        stmt->bindOptional(4, node.productTypeId);
        stmt->bind(5, node.details.name);
        stmt->bindOptional(6, node.details.description);
        stmt->bindOptional(7, node.details.brand);
        stmt->bindOptional(8, node.details.model);
        stmt->bindOptional(9, node.details.dismantlingNotes);
        stmt->bind(10, toSeconds(node.details.dismantlingTimeStart.value_or(now)));
        if (node.details.dismantlingTimeEnd) {
            stmt->bind(11, toSeconds(*node.details.dismantlingTimeEnd));
        } else {
            stmt->bindNull(11);
        }
        stmt->bind(12, toSeconds(now));
        stmt->execute();

        const NodeId id = db_->lastInsertRowId();
        SPDLOG_DEBUG("Inserted node {} '{}' under {}", id, node.details.name,
                     node.parentId ? std::to_string(*node.parentId) : "root");
        return id;
    });
}

void SqliteNodeStore::updateNode(const CompositionNode& node) {
    withIntegrity(nodeContext(node.id, "composition_nodes"), "Update node",
                  [&] {
        auto stmt = db_->prepare(
            "UPDATE composition_nodes SET amount_in_parent = ?, "
            "product_type_id = ?, name = ?, description = ?, brand = ?, "
            "model = ?, dismantling_notes = ?, dismantling_time_start = ?, "
            "dismantling_time_end = ?, updated_at = ? WHERE id = ?");
        stmt->bindOptional(1, node.amountInParent);
        stmt->bindOptional(2, node.productTypeId);
        stmt->bind(3, node.details.name);
        stmt->bindOptional(4, node.details.description);
        stmt->bindOptional(5, node.details.brand);
        stmt->bindOptional(6, node.details.model);
        stmt->bindOptional(7, node.details.dismantlingNotes);
        stmt->bind(8, toSeconds(node.details.dismantlingTimeStart.value_or(
                          node.createdAt)));
        if (node.details.dismantlingTimeEnd) {
            stmt->bind(9, toSeconds(*node.details.dismantlingTimeEnd));
        } else {
            stmt->bindNull(9);
        }
        stmt->bind(10, toSeconds(nowTimestamp()));
        stmt->bind(11, node.id);
        stmt->execute();
    });
    if (db_->changes() == 0) {
        THROW_NOT_FOUND_ERROR(notFoundContext("node", std::to_string(node.id)),
                              "Node " + std::to_string(node.id) +
                                  " does not exist");
    }
}

void SqliteNodeStore::insertMaterialLine(NodeId nodeId,
                                         const MaterialLine& line) {
    withIntegrity(nodeContext(nodeId, "bill_of_materials"),
                  "Insert material line", [&] {
        auto stmt = db_->prepare(
            "INSERT INTO bill_of_materials (node_id, material_id, quantity, "
            "unit, position) VALUES (?1, ?2, ?3, ?4, COALESCE((SELECT "
            "MAX(position) + 1 FROM bill_of_materials WHERE node_id = ?1), 0))");
        stmt->bind(1, nodeId);
        stmt->bind(2, line.materialId);
        stmt->bind(3, line.quantity);
        stmt->bind(4, unitToString(line.unit));
        stmt->execute();
    });
}

void SqliteNodeStore::updateMaterialLine(NodeId nodeId,
                                         const MaterialLine& line) {
    withIntegrity(nodeContext(nodeId, "bill_of_materials"),
                  "Update material line", [&] {
        auto stmt = db_->prepare(
            "UPDATE bill_of_materials SET quantity = ?, unit = ? "
            "WHERE node_id = ? AND material_id = ?");
        stmt->bind(1, line.quantity);
        stmt->bind(2, unitToString(line.unit));
        stmt->bind(3, nodeId);
        stmt->bind(4, line.materialId);
        stmt->execute();
    });
    if (db_->changes() == 0) {
        THROW_NOT_FOUND_ERROR(
            notFoundContext("material", std::to_string(line.materialId)),
            "Material " + std::to_string(line.materialId) +
                " is not on node " + std::to_string(nodeId));
    }
}

void SqliteNodeStore::deleteMaterialLines(NodeId nodeId,
                                          std::span<const MaterialId> ids) {
    auto stmt = db_->prepare(
        "DELETE FROM bill_of_materials WHERE node_id = ? AND material_id = ?");
    for (MaterialId materialId : ids) {
        stmt->reset();
        stmt->bind(1, nodeId);
        stmt->bind(2, materialId);
        stmt->execute();
    }
}

void SqliteNodeStore::setPhysicalProperties(NodeId nodeId,
                                            const PhysicalProperties& props) {
    withIntegrity(nodeContext(nodeId, "physical_properties"),
                  "Set physical properties", [&] {
        auto stmt = db_->prepare(
            "INSERT INTO physical_properties (node_id, weight_kg, height_cm, "
            "width_cm, depth_cm) VALUES (?, ?, ?, ?, ?) "
            "ON CONFLICT(node_id) DO UPDATE SET weight_kg = excluded.weight_kg, "
            "height_cm = excluded.height_cm, width_cm = excluded.width_cm, "
            "depth_cm = excluded.depth_cm");
        stmt->bind(1, nodeId);
        stmt->bindOptional(2, props.weightKg);
        stmt->bindOptional(3, props.heightCm);
        stmt->bindOptional(4, props.widthCm);
        stmt->bindOptional(5, props.depthCm);
        stmt->execute();
    });
}

auto SqliteNodeStore::deletePhysicalProperties(NodeId nodeId) -> bool {
    auto stmt =
        db_->prepare("DELETE FROM physical_properties WHERE node_id = ?");
    stmt->bind(1, nodeId);
    stmt->execute();
    return db_->changes() > 0;
}

void SqliteNodeStore::insertVideo(NodeId nodeId, const VideoLink& video) {
    withIntegrity(nodeContext(nodeId, "node_videos"), "Insert video", [&] {
        auto stmt = db_->prepare(
            "INSERT INTO node_videos (node_id, url, title, description) "
            "VALUES (?, ?, ?, ?)");
        stmt->bind(1, nodeId);
        stmt->bind(2, video.url);
        stmt->bind(3, video.title);
        stmt->bindOptional(4, video.description);
        stmt->execute();
    });
}

auto SqliteNodeStore::deleteSubtree(NodeId id) -> std::vector<NodeId> {
    auto ids = subtreeIds(id);
    if (ids.empty()) {
        return ids;
    }

    // Children before parents, so each cascade only reaches owned rows
    auto stmt = db_->prepare("DELETE FROM composition_nodes WHERE id = ?");
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        stmt->reset();
        stmt->bind(1, *it);
        stmt->execute();
    }

    auto root = std::find(ids.begin(), ids.end(), id);
    std::rotate(ids.begin(), root, root + 1);
    SPDLOG_INFO("Deleted subtree of node {} ({} nodes)", id, ids.size());
    return ids;
}

}  // namespace teardown::composition
