// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include <nlohmann/json.hpp>

#include "composition_node.hpp"
#include "tree_definition.hpp"
#include "tree_view.hpp"

namespace teardown::composition {

using json = nlohmann::json;

namespace {

/// Absent optionals are left out of the document
template <typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

void putTimestamp(json& j, const char* key,
                  const std::optional<Timestamp>& value) {
    if (value) {
        j[key] = value->time_since_epoch().count();
    }
}

template <typename T>
auto readOptional(const json& j, const char* key) -> std::optional<T> {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

auto readTimestamp(const json& j, const char* key)
    -> std::optional<Timestamp> {
    auto seconds = readOptional<int64_t>(j, key);
    if (!seconds) {
        return std::nullopt;
    }
    return Timestamp{std::chrono::seconds{*seconds}};
}

template <typename T>
auto toJsonArray(const std::vector<T>& items) -> json {
    json array = json::array();
    for (const auto& item : items) {
        array.push_back(item.toJson());
    }
    return array;
}

template <typename T>
auto fromJsonArray(const json& j, const char* key, std::vector<T>& out)
    -> std::expected<void, std::string> {
    if (!j.contains(key) || j.at(key).is_null()) {
        return {};
    }
    if (!j.at(key).is_array()) {
        return std::unexpected(std::string("'") + key + "' must be an array");
    }
    for (const auto& item : j.at(key)) {
        auto parsed = T::fromJson(item);
        if (!parsed) {
            return std::unexpected(std::string(key) + ": " + parsed.error());
        }
        out.push_back(std::move(*parsed));
    }
    return {};
}

}  // namespace

// ============================================================================
// MaterialLine
// ============================================================================

auto MaterialLine::toJson() const -> json {
    return {{"materialId", materialId},
            {"quantity", quantity},
            {"unit", unitToString(unit)}};
}

auto MaterialLine::fromJson(const json& j)
    -> std::expected<MaterialLine, std::string> {
    try {
        MaterialLine line;
        line.materialId = j.at("materialId").get<MaterialId>();
        line.quantity = j.at("quantity").get<double>();
        auto unitName = j.value("unit", std::string("kg"));
        auto unit = unitFromString(unitName);
        if (!unit) {
            return std::unexpected("unknown unit '" + unitName + "'");
        }
        line.unit = *unit;
        return line;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid material line: ") +
                               e.what());
    }
}

// ============================================================================
// PhysicalProperties
// ============================================================================

auto PhysicalProperties::toJson() const -> json {
    json j = json::object();
    putOptional(j, "weightKg", weightKg);
    putOptional(j, "heightCm", heightCm);
    putOptional(j, "widthCm", widthCm);
    putOptional(j, "depthCm", depthCm);
    putOptional(j, "volumeCm3", volumeCm3());
    return j;
}

auto PhysicalProperties::fromJson(const json& j)
    -> std::expected<PhysicalProperties, std::string> {
    if (!j.is_object()) {
        return std::unexpected("physical properties must be an object");
    }
    try {
        PhysicalProperties props;
        props.weightKg = readOptional<double>(j, "weightKg");
        props.heightCm = readOptional<double>(j, "heightCm");
        props.widthCm = readOptional<double>(j, "widthCm");
        props.depthCm = readOptional<double>(j, "depthCm");
        return props;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid physical properties: ") +
                               e.what());
    }
}

// ============================================================================
// VideoLink
// ============================================================================

auto VideoLink::toJson() const -> json {
    json j{{"url", url}, {"title", title}};
    putOptional(j, "description", description);
    return j;
}

auto VideoLink::fromJson(const json& j)
    -> std::expected<VideoLink, std::string> {
    try {
        VideoLink video;
        video.url = j.at("url").get<std::string>();
        video.title = j.value("title", std::string{});
        video.description = readOptional<std::string>(j, "description");
        return video;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid video: ") + e.what());
    }
}

// ============================================================================
// NodeDetails
// ============================================================================

auto NodeDetails::toJson() const -> json {
    json j{{"name", name}};
    putOptional(j, "description", description);
    putOptional(j, "brand", brand);
    putOptional(j, "model", model);
    putOptional(j, "dismantlingNotes", dismantlingNotes);
    putTimestamp(j, "dismantlingTimeStart", dismantlingTimeStart);
    putTimestamp(j, "dismantlingTimeEnd", dismantlingTimeEnd);
    return j;
}

auto NodeDetails::fromJson(const json& j)
    -> std::expected<NodeDetails, std::string> {
    try {
        NodeDetails details;
        details.name = j.at("name").get<std::string>();
        details.description = readOptional<std::string>(j, "description");
        details.brand = readOptional<std::string>(j, "brand");
        details.model = readOptional<std::string>(j, "model");
        details.dismantlingNotes =
            readOptional<std::string>(j, "dismantlingNotes");
        details.dismantlingTimeStart = readTimestamp(j, "dismantlingTimeStart");
        details.dismantlingTimeEnd = readTimestamp(j, "dismantlingTimeEnd");
        return details;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid node details: ") +
                               e.what());
    }
}

// ============================================================================
// CompositionNode / NodeUpdate
// ============================================================================

auto CompositionNode::findMaterial(MaterialId materialId) const
    -> const MaterialLine* {
    for (const auto& line : billOfMaterials) {
        if (line.materialId == materialId) {
            return &line;
        }
    }
    return nullptr;
}

auto CompositionNode::toJson() const -> json {
    json j = details.toJson();
    j["id"] = id;
    putOptional(j, "parentId", parentId);
    putOptional(j, "amountInParent", amountInParent);
    j["ownerId"] = ownerId;
    putOptional(j, "productTypeId", productTypeId);
    j["billOfMaterials"] = toJsonArray(billOfMaterials);
    j["components"] = components;
    if (physicalProperties) {
        j["physicalProperties"] = physicalProperties->toJson();
    }
    j["videos"] = toJsonArray(videos);
    j["createdAt"] = createdAt.time_since_epoch().count();
    j["updatedAt"] = updatedAt.time_since_epoch().count();
    return j;
}

auto NodeUpdate::fromJson(const json& j)
    -> std::expected<NodeUpdate, std::string> {
    if (!j.is_object()) {
        return std::unexpected("node update must be an object");
    }
    try {
        NodeUpdate update;
        update.name = readOptional<std::string>(j, "name");
        update.description = readOptional<std::string>(j, "description");
        update.brand = readOptional<std::string>(j, "brand");
        update.model = readOptional<std::string>(j, "model");
        update.dismantlingNotes =
            readOptional<std::string>(j, "dismantlingNotes");
        update.dismantlingTimeStart = readTimestamp(j, "dismantlingTimeStart");
        update.dismantlingTimeEnd = readTimestamp(j, "dismantlingTimeEnd");
        update.productTypeId = readOptional<ProductTypeId>(j, "productTypeId");
        update.amountInParent = readOptional<double>(j, "amountInParent");
        return update;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid node update: ") +
                               e.what());
    }
}

// ============================================================================
// TreeDefinition
// ============================================================================

auto TreeDefinition::toJson() const -> json {
    json j = details.toJson();
    putOptional(j, "id", declaredId);
    putOptional(j, "amountInParent", amountInParent);
    putOptional(j, "productTypeId", productTypeId);
    j["billOfMaterials"] = toJsonArray(billOfMaterials);
    if (physicalProperties) {
        j["physicalProperties"] = physicalProperties->toJson();
    }
    j["videos"] = toJsonArray(videos);
    j["components"] = toJsonArray(components);
    return j;
}

auto TreeDefinition::fromJson(const json& j)
    -> std::expected<TreeDefinition, std::string> {
    if (!j.is_object()) {
        return std::unexpected("tree definition must be an object");
    }

    TreeDefinition definition;
    auto details = NodeDetails::fromJson(j);
    if (!details) {
        return std::unexpected(details.error());
    }
    definition.details = std::move(*details);

    try {
        definition.declaredId = readOptional<NodeId>(j, "id");
        definition.amountInParent = readOptional<double>(j, "amountInParent");
        definition.productTypeId =
            readOptional<ProductTypeId>(j, "productTypeId");
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid tree definition: ") +
                               e.what());
    }

    if (j.contains("physicalProperties") &&
        !j.at("physicalProperties").is_null()) {
        auto props = PhysicalProperties::fromJson(j.at("physicalProperties"));
        if (!props) {
            return std::unexpected(props.error());
        }
        definition.physicalProperties = *props;
    }

    if (auto r = fromJsonArray(j, "billOfMaterials",
                               definition.billOfMaterials);
        !r) {
        return std::unexpected(definition.details.name + ": " + r.error());
    }
    if (auto r = fromJsonArray(j, "videos", definition.videos); !r) {
        return std::unexpected(definition.details.name + ": " + r.error());
    }
    if (auto r = fromJsonArray(j, "components", definition.components); !r) {
        return std::unexpected(definition.details.name + "/" + r.error());
    }
    return definition;
}

// ============================================================================
// Views
// ============================================================================

auto NodeView::toJson() const -> json {
    json j = details.toJson();
    j["id"] = id;
    putOptional(j, "parentId", parentId);
    putOptional(j, "amountInParent", amountInParent);
    j["ownerId"] = ownerId;
    putOptional(j, "productTypeId", productTypeId);
    j["billOfMaterials"] = toJsonArray(billOfMaterials);
    j["components"] = toJsonArray(components);
    return j;
}

auto TreeView::toJson() const -> json {
    return {{"maxDepth", maxDepth}, {"roots", toJsonArray(roots)}};
}

}  // namespace teardown::composition
