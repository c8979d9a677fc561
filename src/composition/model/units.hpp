// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef TEARDOWN_COMPOSITION_MODEL_UNITS_HPP
#define TEARDOWN_COMPOSITION_MODEL_UNITS_HPP

#include <optional>
#include <string>
#include <string_view>

namespace teardown::composition {

/**
 * @brief Units a material line may be recorded in
 */
enum class Unit { Kilogram, Gram, Meter, Centimeter };

/**
 * @brief Physical dimension of a unit. Quantities are only comparable
 * within one dimension.
 */
enum class Dimension { Mass, Length };

[[nodiscard]] auto unitToString(Unit unit) -> std::string;

/**
 * @brief Parse "kg", "g", "m" or "cm"
 * @return The unit, or nullopt for anything else
 */
[[nodiscard]] auto unitFromString(std::string_view text) -> std::optional<Unit>;

[[nodiscard]] auto dimensionOf(Unit unit) noexcept -> Dimension;

[[nodiscard]] auto dimensionToString(Dimension dimension) -> std::string;

/**
 * @brief kg for mass, m for length
 */
[[nodiscard]] auto baseUnit(Dimension dimension) noexcept -> Unit;

/**
 * @brief Express @p quantity of @p unit in the base unit of its dimension
 */
[[nodiscard]] auto toBaseUnit(double quantity, Unit unit) noexcept -> double;

}  // namespace teardown::composition

#endif  // TEARDOWN_COMPOSITION_MODEL_UNITS_HPP
