// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_ERRORS_HPP
#define TEARDOWN_COMPOSITION_ERRORS_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "atom/error/exception.hpp"
#include "model/types.hpp"

namespace teardown::composition {

/**
 * @brief Where a composition error happened and which rule it broke
 *
 * Stored nodes are identified by nodeId, candidate nodes (not yet written)
 * by nodePath, the slash-joined names from the candidate root.
 */
struct ErrorContext {
    std::optional<NodeId> nodeId;
    std::string nodePath;
    std::string constraint;
    /// NotFound only: "owner", "product type", "material" or "node"
    std::string entity;
    std::vector<std::string> missingIds;

    [[nodiscard]] auto describe() const -> std::string;
    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Base of every composition error
 */
class Error : public atom::error::Exception {
public:
    Error(const char* file, int line, const char* func, ErrorContext context,
          const std::string& message)
        : Exception(file, line, func, message), context_(std::move(context)) {}

    [[nodiscard]] auto context() const noexcept -> const ErrorContext& {
        return context_;
    }

private:
    ErrorContext context_;
};

/// Structural or field rule violated by a candidate, found before any write
class ValidationError : public Error {
    using Error::Error;
};

/// A node would become its own ancestor
class CycleError : public ValidationError {
    using ValidationError::ValidationError;
};

/// A node has neither materials nor components, a root/child amount rule is
/// broken, or a material is listed twice on one node
class CompositionError : public ValidationError {
    using ValidationError::ValidationError;
};

/// A leaf has no bill of materials
class IncompleteBomError : public ValidationError {
    using ValidationError::ValidationError;
};

/// A scalar field is out of range
class FieldError : public ValidationError {
    using ValidationError::ValidationError;
};

/// A referenced owner, product type, material or node does not exist
class NotFoundError : public Error {
    using Error::Error;
};

/// The database rejected a write on a constraint
class IntegrityError : public Error {
    using Error::Error;
};

/// Persisted data breaks a tree invariant (e.g. a cycle)
class InvariantViolationError : public Error {
    using Error::Error;
};

/// A material's lines cannot be summed under the active unit policy
class UnitMismatchError : public Error {
    using Error::Error;
};

#define TEARDOWN_THROW_COMPOSITION(Type, context, message)                \
    throw teardown::composition::Type(ATOM_FILE_NAME, ATOM_FILE_LINE,     \
                                      ATOM_FUNC_NAME, context, message)

#define THROW_CYCLE_ERROR(context, message) \
    TEARDOWN_THROW_COMPOSITION(CycleError, context, message)

#define THROW_COMPOSITION_ERROR(context, message) \
    TEARDOWN_THROW_COMPOSITION(CompositionError, context, message)

#define THROW_INCOMPLETE_BOM_ERROR(context, message) \
    TEARDOWN_THROW_COMPOSITION(IncompleteBomError, context, message)

#define THROW_FIELD_ERROR(context, message) \
    TEARDOWN_THROW_COMPOSITION(FieldError, context, message)

#define THROW_NOT_FOUND_ERROR(context, message) \
    TEARDOWN_THROW_COMPOSITION(NotFoundError, context, message)

#define THROW_INTEGRITY_ERROR(context, message) \
    TEARDOWN_THROW_COMPOSITION(IntegrityError, context, message)

#define THROW_INVARIANT_VIOLATION_ERROR(context, message) \
    TEARDOWN_THROW_COMPOSITION(InvariantViolationError, context, message)

#define THROW_UNIT_MISMATCH_ERROR(context, message) \
    TEARDOWN_THROW_COMPOSITION(UnitMismatchError, context, message)

/**
 * @brief Kind of rule a validation failure broke
 */
enum class Violation { Cycle, Composition, IncompleteBom, Field };

[[nodiscard]] auto violationToString(Violation violation) -> std::string;

/**
 * @brief Result of a failed validator check
 */
struct ValidationFailure {
    Violation violation;
    ErrorContext context;
    std::string message;
};

/**
 * @brief Throws the ValidationError subclass matching @p failure
 */
[[noreturn]] void throwValidationFailure(const ValidationFailure& failure,
                                         const char* file, int line,
                                         const char* func);

#define THROW_VALIDATION_FAILURE(failure)                                  \
    teardown::composition::throwValidationFailure(                        \
        failure, ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME)

/**
 * @brief NotFound context for a single missing id
 */
[[nodiscard]] auto notFoundContext(std::string entity, const std::string& id)
    -> ErrorContext;

[[nodiscard]] inline auto nodeContext(NodeId id, std::string constraint = {})
    -> ErrorContext {
    ErrorContext context;
    context.nodeId = id;
    context.constraint = std::move(constraint);
    return context;
}

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_ERRORS_HPP
