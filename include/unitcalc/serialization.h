#pragma once

#include "alias_manager.h"
#include "unit.h"
#include <string>

namespace unitcalc {

// {"formula", "render", "alias" (or null), "scale", "scaleValue", "composition"}
// where composition maps fundamental symbols to exponents.
std::string generateUnitJSON(const Unit& unit, int indent = 2);

// Array of {"name", "render", "scale", "scaleValue", "composition"} sorted by name.
std::string generateRegistryJSON(const UnitAliasManager& registry, int indent = 2);

}  // namespace unitcalc
