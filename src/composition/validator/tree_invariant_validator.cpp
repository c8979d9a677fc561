// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include "tree_invariant_validator.hpp"

#include <cmath>
#include <unordered_set>
#include <utility>
#include <vector>

namespace teardown::composition {

namespace {

auto fail(Violation violation, ErrorContext context, std::string message)
    -> ValidationResult {
    return std::unexpected(
        ValidationFailure{violation, std::move(context), std::move(message)});
}

auto withConstraint(ErrorContext context, std::string constraint)
    -> ErrorContext {
    context.constraint = std::move(constraint);
    return context;
}

auto candidateContext(const TreeDefinition& node, const std::string& path)
    -> ErrorContext {
    ErrorContext context;
    context.nodeId = node.declaredId;
    context.nodePath = path;
    return context;
}

auto label(const ErrorContext& where) -> std::string {
    if (!where.nodePath.empty()) {
        return "Node '" + where.nodePath + "'";
    }
    if (where.nodeId) {
        return "Node " + std::to_string(*where.nodeId);
    }
    return "Node";
}

/// Length in code points of UTF-8 text
auto textLength(const std::string& text) -> size_t {
    size_t length = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++length;
        }
    }
    return length;
}

auto trimmed(const std::string& text) -> std::string {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

auto checkTextLimit(const std::optional<std::string>& value, size_t limit,
                    const char* field, const ErrorContext& where)
    -> ValidationResult {
    if (value && textLength(*value) > limit) {
        return fail(Violation::Field,
                    withConstraint(where, std::string(field) + "_length"),
                    label(where) + ": " + field + " exceeds " +
                        std::to_string(limit) + " characters");
    }
    return {};
}

auto positive(double value) -> bool {
    return std::isfinite(value) && value > 0.0;
}

auto checkNonEmptyAndUnique(const std::vector<MaterialLine>& lines,
                            bool hasComponents, const ErrorContext& where)
    -> ValidationResult {
    if (lines.empty() && !hasComponents) {
        return fail(Violation::Composition,
                    withConstraint(where, "non_empty_composition"),
                    label(where) +
                        " must have a bill of materials or components");
    }
    std::unordered_set<MaterialId> seen;
    for (const auto& line : lines) {
        if (!seen.insert(line.materialId).second) {
            return fail(Violation::Composition,
                        withConstraint(where, "unique_material_per_node"),
                        label(where) + " lists material " +
                            std::to_string(line.materialId) + " more than once");
        }
    }
    return {};
}

auto checkVideo(const VideoLink& video, const ErrorContext& where)
    -> ValidationResult {
    const bool web = video.url.starts_with("http://") ||
                     video.url.starts_with("https://");
    if (!web || video.url.find_first_of(" \t\r\n") != std::string::npos) {
        return fail(Violation::Field, withConstraint(where, "video_url"),
                    label(where) + ": '" + video.url +
                        "' is not an http(s) URL");
    }
    if (textLength(video.url) > FieldLimits::MAX_VIDEO_URL_LENGTH) {
        return fail(Violation::Field, withConstraint(where, "video_url_length"),
                    label(where) + ": video URL exceeds " +
                        std::to_string(FieldLimits::MAX_VIDEO_URL_LENGTH) +
                        " characters");
    }
    if (auto r = checkTextLimit(std::optional<std::string>(video.title),
                                FieldLimits::MAX_VIDEO_TITLE_LENGTH,
                                "video_title", where);
        !r) {
        return r;
    }
    return checkTextLimit(video.description,
                          FieldLimits::MAX_VIDEO_DESCRIPTION_LENGTH,
                          "video_description", where);
}

}  // namespace

auto TreeInvariantValidator::childPath(const std::string& parentPath,
                                       const TreeDefinition& child)
    -> std::string {
    return parentPath.empty() ? child.details.name
                              : parentPath + "/" + child.details.name;
}

// ============================================================================
// Acyclicity
// ============================================================================

auto TreeInvariantValidator::checkAcyclic(const TreeDefinition& root,
                                          std::span<const NodeId> ancestorIds)
    -> ValidationResult {
    std::unordered_set<NodeId> ancestors(ancestorIds.begin(),
                                         ancestorIds.end());
    std::unordered_set<NodeId> visited;

    std::vector<std::pair<const TreeDefinition*, std::string>> stack;
    stack.emplace_back(&root, root.details.name);
    while (!stack.empty()) {
        auto [node, path] = std::move(stack.back());
        stack.pop_back();

        if (node->declaredId) {
            const NodeId id = *node->declaredId;
            if (ancestors.contains(id)) {
                return fail(Violation::Cycle,
                            withConstraint(candidateContext(*node, path),
                                           "acyclic"),
                            label(candidateContext(*node, path)) +
                                " declares id " + std::to_string(id) +
                                ", which is an ancestor of the insertion point");
            }
            if (!visited.insert(id).second) {
                return fail(Violation::Cycle,
                            withConstraint(candidateContext(*node, path),
                                           "acyclic"),
                            label(candidateContext(*node, path)) +
                                " repeats id " + std::to_string(id) +
                                " already used by another node of the tree");
            }
        }

        for (auto it = node->components.rbegin(); it != node->components.rend();
             ++it) {
            stack.emplace_back(&*it, childPath(path, *it));
        }
    }
    return {};
}

auto TreeInvariantValidator::checkAcyclic(const NodeIndex& index,
                                          NodeId rootId) -> ValidationResult {
    std::unordered_set<NodeId> visited;
    std::vector<NodeId> stack{rootId};
    while (!stack.empty()) {
        const NodeId id = stack.back();
        stack.pop_back();
        if (!visited.insert(id).second) {
            return fail(Violation::Cycle, nodeContext(id, "acyclic"),
                        "Node " + std::to_string(id) +
                            " is reachable from itself");
        }
        const auto* node = index.find(id);
        if (node == nullptr) {
            continue;
        }
        stack.insert(stack.end(), node->components.rbegin(),
                     node->components.rend());
    }
    return {};
}

// ============================================================================
// Composition
// ============================================================================

auto TreeInvariantValidator::checkAmount(const std::optional<double>& amount,
                                         NodeRole role,
                                         const ErrorContext& where)
    -> ValidationResult {
    if (role == NodeRole::Root) {
        if (amount) {
            return fail(Violation::Composition,
                        withConstraint(where, "root_has_no_amount"),
                        label(where) +
                            ": a base product cannot have an amount in parent");
        }
        return {};
    }
    if (!amount) {
        return fail(Violation::Composition,
                    withConstraint(where, "child_amount_required"),
                    label(where) + ": a component needs an amount in parent");
    }
    if (!positive(*amount)) {
        return fail(Violation::Composition,
                    withConstraint(where, "child_amount_positive"),
                    label(where) + ": amount in parent must be positive, got " +
                        std::to_string(*amount));
    }
    return {};
}

auto TreeInvariantValidator::checkComposition(const TreeDefinition& node,
                                              NodeRole role,
                                              const std::string& path)
    -> ValidationResult {
    const auto where = candidateContext(node, path);
    if (auto r = checkAmount(node.amountInParent, role, where); !r) {
        return r;
    }
    return checkNonEmptyAndUnique(node.billOfMaterials,
                                  !node.components.empty(), where);
}

auto TreeInvariantValidator::checkComposition(const CompositionNode& node)
    -> ValidationResult {
    const auto where = nodeContext(node.id);
    const auto role = node.isRoot() ? NodeRole::Root : NodeRole::Child;
    if (auto r = checkAmount(node.amountInParent, role, where); !r) {
        return r;
    }
    return checkNonEmptyAndUnique(node.billOfMaterials,
                                  !node.components.empty(), where);
}

// ============================================================================
// Leaf resolution
// ============================================================================

auto TreeInvariantValidator::checkLeavesResolve(const TreeDefinition& root)
    -> ValidationResult {
    std::vector<std::pair<const TreeDefinition*, std::string>> stack;
    stack.emplace_back(&root, root.details.name);
    while (!stack.empty()) {
        auto [node, path] = std::move(stack.back());
        stack.pop_back();
        if (node->components.empty() && node->billOfMaterials.empty()) {
            auto where = candidateContext(*node, path);
            return fail(Violation::IncompleteBom,
                        withConstraint(where, "leaf_has_materials"),
                        label(where) +
                            " has no components and needs a bill of materials");
        }
        for (auto it = node->components.rbegin(); it != node->components.rend();
             ++it) {
            stack.emplace_back(&*it, childPath(path, *it));
        }
    }
    return {};
}

auto TreeInvariantValidator::checkLeavesResolve(const NodeIndex& index,
                                                NodeId rootId)
    -> ValidationResult {
    std::unordered_set<NodeId> visited;
    std::vector<NodeId> stack{rootId};
    while (!stack.empty()) {
        const NodeId id = stack.back();
        stack.pop_back();
        const auto* node = index.find(id);
        if (node == nullptr || !visited.insert(id).second) {
            continue;
        }
        if (node->isLeaf() && node->billOfMaterials.empty()) {
            return fail(Violation::IncompleteBom,
                        nodeContext(id, "leaf_has_materials"),
                        "Node " + std::to_string(id) +
                            " has no components and needs a bill of materials");
        }
        stack.insert(stack.end(), node->components.rbegin(),
                     node->components.rend());
    }
    return {};
}

// ============================================================================
// Fields
// ============================================================================

auto TreeInvariantValidator::checkDetails(const NodeDetails& details,
                                          const ErrorContext& where)
    -> ValidationResult {
    const auto nameLength = textLength(trimmed(details.name));
    if (nameLength < FieldLimits::MIN_NAME_LENGTH ||
        nameLength > FieldLimits::MAX_NAME_LENGTH) {
        return fail(Violation::Field, withConstraint(where, "name_length"),
                    label(where) + ": name must be " +
                        std::to_string(FieldLimits::MIN_NAME_LENGTH) + " to " +
                        std::to_string(FieldLimits::MAX_NAME_LENGTH) + " characters");
    }
    if (auto r = checkTextLimit(details.description,
                                FieldLimits::MAX_DESCRIPTION_LENGTH, "description",
                                where);
        !r) {
        return r;
    }
    if (auto r = checkTextLimit(details.brand, FieldLimits::MAX_BRAND_LENGTH, "brand",
                                where);
        !r) {
        return r;
    }
    if (auto r = checkTextLimit(details.model, FieldLimits::MAX_MODEL_LENGTH, "model",
                                where);
        !r) {
        return r;
    }
    if (auto r = checkTextLimit(details.dismantlingNotes,
                                FieldLimits::MAX_NOTES_LENGTH, "dismantling_notes",
                                where);
        !r) {
        return r;
    }
    if (details.dismantlingTimeStart && details.dismantlingTimeEnd &&
        *details.dismantlingTimeEnd < *details.dismantlingTimeStart) {
        return fail(Violation::Field,
                    withConstraint(where, "dismantling_time_order"),
                    label(where) +
                        ": dismantling end time precedes its start time");
    }
    return {};
}

auto TreeInvariantValidator::checkMaterialLine(const MaterialLine& line,
                                               const ErrorContext& where)
    -> ValidationResult {
    if (!positive(line.quantity)) {
        return fail(Violation::Field,
                    withConstraint(where, "material_quantity_positive"),
                    label(where) + ": quantity of material " +
                        std::to_string(line.materialId) + " must be positive");
    }
    return {};
}

auto TreeInvariantValidator::checkPhysicalProperties(
    const PhysicalProperties& props, const ErrorContext& where)
    -> ValidationResult {
    const std::pair<const char*, const std::optional<double>*> values[] = {
        {"weight_kg", &props.weightKg},
        {"height_cm", &props.heightCm},
        {"width_cm", &props.widthCm},
        {"depth_cm", &props.depthCm}};
    for (const auto& [field, value] : values) {
        if (*value && !positive(**value)) {
            return fail(Violation::Field,
                        withConstraint(where, "physical_property_positive"),
                        label(where) + ": " + field + " must be positive");
        }
    }
    return {};
}

auto TreeInvariantValidator::checkFields(const TreeDefinition& node,
                                         const std::string& path)
    -> ValidationResult {
    const auto where = candidateContext(node, path);
    if (auto r = checkDetails(node.details, where); !r) {
        return r;
    }
    for (const auto& line : node.billOfMaterials) {
        if (auto r = checkMaterialLine(line, where); !r) {
            return r;
        }
    }
    if (node.physicalProperties) {
        if (auto r = checkPhysicalProperties(*node.physicalProperties, where);
            !r) {
            return r;
        }
    }
    for (const auto& video : node.videos) {
        if (auto r = checkVideo(video, where); !r) {
            return r;
        }
    }
    return {};
}

auto TreeInvariantValidator::checkFields(const CompositionNode& node)
    -> ValidationResult {
    const auto where = nodeContext(node.id);
    if (auto r = checkDetails(node.details, where); !r) {
        return r;
    }
    for (const auto& line : node.billOfMaterials) {
        if (auto r = checkMaterialLine(line, where); !r) {
            return r;
        }
    }
    if (node.physicalProperties) {
        if (auto r = checkPhysicalProperties(*node.physicalProperties, where);
            !r) {
            return r;
        }
    }
    for (const auto& video : node.videos) {
        if (auto r = checkVideo(video, where); !r) {
            return r;
        }
    }
    return {};
}

// ============================================================================
// Whole trees
// ============================================================================

auto TreeInvariantValidator::validateTree(const TreeDefinition& root,
                                          NodeRole role,
                                          std::span<const NodeId> ancestorIds)
    -> ValidationResult {
    if (auto r = checkAcyclic(root, ancestorIds); !r) {
        return r;
    }

    struct Frame {
        const TreeDefinition* node;
        std::string path;
        NodeRole role;
    };
    std::vector<Frame> stack;
    stack.push_back({&root, root.details.name, role});
    while (!stack.empty()) {
        auto frame = std::move(stack.back());
        stack.pop_back();
        if (auto r = checkComposition(*frame.node, frame.role, frame.path);
            !r) {
            return r;
        }
        if (auto r = checkFields(*frame.node, frame.path); !r) {
            return r;
        }
        const auto& children = frame.node->components;
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back({&*it, childPath(frame.path, *it), NodeRole::Child});
        }
    }

    return checkLeavesResolve(root);
}

auto TreeInvariantValidator::validateStoredSubtree(const NodeIndex& index,
                                                   NodeId rootId)
    -> ValidationResult {
    if (auto r = checkAcyclic(index, rootId); !r) {
        return r;
    }

    // Acyclic from here on, so a plain walk terminates
    std::vector<NodeId> stack{rootId};
    while (!stack.empty()) {
        const NodeId id = stack.back();
        stack.pop_back();
        const auto* node = index.find(id);
        if (node == nullptr) {
            continue;
        }
        if (auto r = checkComposition(*node); !r) {
            return r;
        }
        if (auto r = checkFields(*node); !r) {
            return r;
        }
        stack.insert(stack.end(), node->components.rbegin(),
                     node->components.rend());
    }

    return checkLeavesResolve(index, rootId);
}

}  // namespace teardown::composition
