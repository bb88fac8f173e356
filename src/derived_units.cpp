#include "unitcalc/derived_units.h"
#include "unitcalc/unit.h"
#include <algorithm>

namespace unitcalc {

namespace {

// Definitions are ordinary formulas, so they go through the same parser as
// user input.
const std::vector<DerivedUnitInfo> DERIVED_UNITS = {
    // SI derived units
    {"N", "kg*m/s^2", "newton (force)"},
    {"J", "N*m", "joule (energy)"},
    {"W", "J/s", "watt (power)"},
    {"C", "A*s", "coulomb (charge)"},
    {"V", "W/A", "volt (electric potential)"},
    {"Ohm", "V/A", "ohm (resistance)"},
    {"ohm", "Ohm", "ohm (resistance)"},
    {"\xCE\xA9", "Ohm", "ohm (resistance)"},  // Ω
    {"Hz", "1/s", "hertz (frequency)"},
    {"Pa", "N/m^2", "pascal (pressure)"},
    {"T", "kg/(s^2*A)", "tesla (magnetic flux density)"},
    {"F", "C/V", "farad (capacitance)"},
    {"Wb", "V*s", "weber (magnetic flux)"},
    {"H", "Wb/A", "henry (inductance)"},
    {"S", "A/V", "siemens (conductance)"},

    // Common multiples
    {"t", "1000*kg", "tonne"},
    {"ton", "t", "tonne"},
    {"min", "60*s", "minute"},
    {"h", "60*min", "hour"},
    {"day", "24*h", "day"},
    {"week", "7*day", "week"},
    {"month", "30.4375*day", "mean Julian month"},
    {"year", "365.25*day", "Julian year"},
    {"L", "1e-3*m^3", "litre"},
    {"bar", "1e5*Pa", "bar"},
    {"atm", "101325*Pa", "standard atmosphere"},
    {"eV", "1.602176634e-19*J", "electronvolt"},
    {"cal", "4.184*J", "thermochemical calorie"},
    {"deg", "0.017453292519943295*rad", "degree of arc"},
    {"\xC2\xB0", "deg", "degree of arc"},  // °
};

}  // namespace

const std::vector<DerivedUnitInfo>& DerivedUnits::getAll() {
    return DERIVED_UNITS;
}

bool DerivedUnits::isDerivedUnit(const std::string& name) {
    return std::any_of(DERIVED_UNITS.begin(), DERIVED_UNITS.end(),
                       [&name](const DerivedUnitInfo& info) { return info.name == name; });
}

int registerDerivedUnits(UnitAliasManager& registry) {
    int count = 0;
    for (const auto& info : DERIVED_UNITS) {
        Unit::parse(info.name + " = " + info.formula, registry);
        ++count;
    }
    return count;
}

}  // namespace unitcalc
