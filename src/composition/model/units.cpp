// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Teardown - Product composition and bill-of-materials engine
 * Copyright (C) 2024 Max Qian
 */

#include "units.hpp"

namespace teardown::composition {

auto unitToString(Unit unit) -> std::string {
    switch (unit) {
        case Unit::Kilogram: return "kg";
        case Unit::Gram: return "g";
        case Unit::Meter: return "m";
        case Unit::Centimeter: return "cm";
    }
    return "kg";
}

auto unitFromString(std::string_view text) -> std::optional<Unit> {
    if (text == "kg") return Unit::Kilogram;
    if (text == "g") return Unit::Gram;
    if (text == "m") return Unit::Meter;
    if (text == "cm") return Unit::Centimeter;
    return std::nullopt;
}

auto dimensionOf(Unit unit) noexcept -> Dimension {
    switch (unit) {
        case Unit::Kilogram:
        case Unit::Gram:
            return Dimension::Mass;
        case Unit::Meter:
        case Unit::Centimeter:
            return Dimension::Length;
    }
    return Dimension::Mass;
}

auto dimensionToString(Dimension dimension) -> std::string {
    return dimension == Dimension::Mass ? "mass" : "length";
}

auto baseUnit(Dimension dimension) noexcept -> Unit {
    return dimension == Dimension::Mass ? Unit::Kilogram : Unit::Meter;
}

auto toBaseUnit(double quantity, Unit unit) noexcept -> double {
    switch (unit) {
        case Unit::Gram: return quantity / 1000.0;
        case Unit::Centimeter: return quantity / 100.0;
        case Unit::Kilogram:
        case Unit::Meter:
            return quantity;
    }
    return quantity;
}

}  // namespace teardown::composition
