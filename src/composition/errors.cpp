// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include "errors.hpp"

#include <nlohmann/json.hpp>

namespace teardown::composition {

auto ErrorContext::describe() const -> std::string {
    std::string out;
    auto append = [&out](const std::string& part) {
        if (!out.empty()) {
            out += ", ";
        }
        out += part;
    };
    if (nodeId) {
        append("node " + std::to_string(*nodeId));
    }
    if (!nodePath.empty()) {
        append("path '" + nodePath + "'");
    }
    if (!constraint.empty()) {
        append("constraint " + constraint);
    }
    if (!entity.empty()) {
        std::string ids;
        for (const auto& id : missingIds) {
            ids += ids.empty() ? id : ", " + id;
        }
        append(entity + " [" + ids + "]");
    }
    return out;
}

auto ErrorContext::toJson() const -> nlohmann::json {
    nlohmann::json j;
    j["nodeId"] = nodeId ? nlohmann::json(*nodeId) : nlohmann::json(nullptr);
    j["nodePath"] = nodePath;
    j["constraint"] = constraint;
    j["entity"] = entity;
    j["missingIds"] = missingIds;
    return j;
}

auto violationToString(Violation violation) -> std::string {
    switch (violation) {
        case Violation::Cycle: return "cycle";
        case Violation::Composition: return "composition";
        case Violation::IncompleteBom: return "incomplete_bom";
        case Violation::Field: return "field";
    }
    return "composition";
}

void throwValidationFailure(const ValidationFailure& failure, const char* file,
                            int line, const char* func) {
    switch (failure.violation) {
        case Violation::Cycle:
            throw CycleError(file, line, func, failure.context,
                             failure.message);
        case Violation::Composition:
            throw CompositionError(file, line, func, failure.context,
                                   failure.message);
        case Violation::IncompleteBom:
            throw IncompleteBomError(file, line, func, failure.context,
                                     failure.message);
        case Violation::Field:
            throw FieldError(file, line, func, failure.context,
                             failure.message);
    }
    throw ValidationError(file, line, func, failure.context, failure.message);
}

auto notFoundContext(std::string entity, const std::string& id)
    -> ErrorContext {
    ErrorContext context;
    context.entity = std::move(entity);
    context.missingIds.push_back(id);
    context.constraint = "exists";
    return context;
}

}  // namespace teardown::composition
