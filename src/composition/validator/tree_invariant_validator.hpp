// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_VALIDATOR_TREE_INVARIANT_VALIDATOR_HPP
#define TEARDOWN_COMPOSITION_VALIDATOR_TREE_INVARIANT_VALIDATOR_HPP

#include <expected>
#include <optional>
#include <span>
#include <string>

#include "../errors.hpp"
#include "../model/composition_node.hpp"
#include "../model/node_index.hpp"
#include "../model/tree_definition.hpp"

namespace teardown::composition {

using ValidationResult = std::expected<void, ValidationFailure>;

/**
 * @brief Whether a candidate will be stored as a root or under a parent
 */
enum class NodeRole { Root, Child };

/**
 * @brief Field limits for node scalars
 */
struct FieldLimits {
    static constexpr size_t MIN_NAME_LENGTH = 2;
    static constexpr size_t MAX_NAME_LENGTH = 50;
    static constexpr size_t MAX_DESCRIPTION_LENGTH = 500;
    static constexpr size_t MAX_BRAND_LENGTH = 100;
    static constexpr size_t MAX_MODEL_LENGTH = 100;
    static constexpr size_t MAX_NOTES_LENGTH = 500;
    static constexpr size_t MAX_VIDEO_URL_LENGTH = 250;
    static constexpr size_t MAX_VIDEO_TITLE_LENGTH = 100;
    static constexpr size_t MAX_VIDEO_DESCRIPTION_LENGTH = 500;
};

/**
 * @brief Structural checks over candidate trees and stored subtrees
 *
 * Every check is a pure function of its arguments: nothing here touches the
 * store. Checks return the first violation found; callers turn it into an
 * exception with THROW_VALIDATION_FAILURE.
 *
 * Invariants:
 * 1. No node is its own ancestor.
 * 2. A root has no amountInParent; every other node has one > 0.
 * 3. Every node has materials or components.
 * 4. Every node without components has materials.
 */
class TreeInvariantValidator {
public:
    /**
     * @brief Declared ids must be unique in the candidate and absent from
     * @p ancestorIds (the target parent and its ancestors)
     */
    [[nodiscard]] static auto checkAcyclic(
        const TreeDefinition& root, std::span<const NodeId> ancestorIds = {})
        -> ValidationResult;

    /**
     * @brief Walks component links from @p rootId; reaching a node twice is
     * a cycle
     */
    [[nodiscard]] static auto checkAcyclic(const NodeIndex& index,
                                           NodeId rootId) -> ValidationResult;

    /**
     * @brief Invariants 2 and 3 for one candidate node, plus at most one
     * line per material
     */
    [[nodiscard]] static auto checkComposition(const TreeDefinition& node,
                                               NodeRole role,
                                               const std::string& path)
        -> ValidationResult;

    [[nodiscard]] static auto checkComposition(const CompositionNode& node)
        -> ValidationResult;

    /**
     * @brief Invariant 2 for one amount: absent on a root, finite and > 0
     * on a child
     */
    [[nodiscard]] static auto checkAmount(const std::optional<double>& amount,
                                          NodeRole role,
                                          const ErrorContext& where)
        -> ValidationResult;

    /**
     * @brief Invariant 4 over the whole candidate
     */
    [[nodiscard]] static auto checkLeavesResolve(const TreeDefinition& root)
        -> ValidationResult;

    [[nodiscard]] static auto checkLeavesResolve(const NodeIndex& index,
                                                 NodeId rootId)
        -> ValidationResult;

    /**
     * @brief Scalar limits of one node: name length, text lengths, time
     * ordering, positive quantities and measurements, video URLs
     */
    [[nodiscard]] static auto checkFields(const TreeDefinition& node,
                                          const std::string& path)
        -> ValidationResult;

    [[nodiscard]] static auto checkFields(const CompositionNode& node)
        -> ValidationResult;

    [[nodiscard]] static auto checkDetails(const NodeDetails& details,
                                           const ErrorContext& where)
        -> ValidationResult;

    [[nodiscard]] static auto checkMaterialLine(const MaterialLine& line,
                                                const ErrorContext& where)
        -> ValidationResult;

    [[nodiscard]] static auto checkPhysicalProperties(
        const PhysicalProperties& props, const ErrorContext& where)
        -> ValidationResult;

    /**
     * @brief Full candidate validation: acyclicity, then composition and
     * fields for every node in pre-order, then leaf resolution
     *
     * @param role Root for a new product, Child for a grafted sub-tree
     */
    [[nodiscard]] static auto validateTree(
        const TreeDefinition& root, NodeRole role,
        std::span<const NodeId> ancestorIds = {}) -> ValidationResult;

    /**
     * @brief The same checks over a subtree loaded from the store
     */
    [[nodiscard]] static auto validateStoredSubtree(const NodeIndex& index,
                                                    NodeId rootId)
        -> ValidationResult;

    /**
     * @brief "Chair/Seat" style path of a child under @p parentPath
     */
    [[nodiscard]] static auto childPath(const std::string& parentPath,
                                        const TreeDefinition& child)
        -> std::string;
};

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_VALIDATOR_TREE_INVARIANT_VALIDATOR_HPP
