#pragma once

#include <array>
#include <optional>
#include <string>

namespace unitcalc {

// SI base dimensions. Declaration order is the canonical display order.
enum class FundamentalUnit {
    Mass,               // kg
    Angle,              // rad
    Length,             // m
    Time,               // s
    LuminousIntensity,  // cd
    Temperature,        // K
    Current,            // A
    AmountOfSubstance,  // mol
    Dimensionless       // 1
};

// Fixed display order used by every canonical rendering.
extern const std::array<FundamentalUnit, 9> UNIT_ORDER;

// Canonical symbol ("kg", "rad", ..., "1")
std::string fundamentalSymbol(FundamentalUnit unit);

// Human-readable name ("mass", "length", ...)
std::string fundamentalName(FundamentalUnit unit);

// Reverse of fundamentalSymbol(); "1" maps to Dimensionless.
std::optional<FundamentalUnit> fundamentalFromSymbol(const std::string& symbol);

// Position of the unit inside UNIT_ORDER.
int displayOrder(FundamentalUnit unit);

}  // namespace unitcalc
