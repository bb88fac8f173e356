#pragma once

#include "alias_manager.h"
#include <string>
#include <vector>

namespace unitcalc {

struct DerivedUnitInfo {
    std::string name;         // "N"
    std::string formula;      // "kg*m/s^2"
    std::string description;  // "newton (force)"
};

class DerivedUnits {
public:
    // Catalogue in registration order; later entries may use earlier names.
    static const std::vector<DerivedUnitInfo>& getAll();

    static bool isDerivedUnit(const std::string& name);
};

// Registers the whole catalogue; returns the number of entries processed.
// Throws AliasConflict if the registry already holds a different definition.
int registerDerivedUnits(UnitAliasManager& registry);

}  // namespace unitcalc
