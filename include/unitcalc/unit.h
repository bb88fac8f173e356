#pragma once

#include "alias_manager.h"
#include "prefixed_unit.h"
#include <optional>
#include <ostream>
#include <string>

namespace unitcalc {

// ============================================================================
// Unit
// ============================================================================

/**
 * @brief Public unit value: the formula it came from, the resolved
 * PrefixedUnit and, optionally, the alias it is known by.
 *
 * Immutable. Arithmetic returns new units with a canonical formula and no
 * alias. Equality compares the resolved PrefixedUnit only, so "N" and
 * "kg*m/s**2" are equal units.
 */
class Unit {
public:
    Unit() = default;

    // Parses text against the registry. An "ALIAS = formula" input registers
    // ALIAS (throws AliasConflict on a different existing definition) and
    // records it on the result.
    static Unit parse(const std::string& text, UnitAliasManager& registry);

    static Unit fromComposition(const UnitComposition& composition);
    static Unit fromPrefixedUnit(const PrefixedUnit& unit);

    const std::string& getFormula() const { return formula_; }
    const PrefixedUnit& getPrefixedUnit() const { return prefixed_; }
    const UnitComposition& getComposition() const { return prefixed_.getComposition(); }
    const Scale& getScale() const { return prefixed_.getScale(); }
    const std::optional<std::string>& getAlias() const { return alias_; }

    Unit multiply(const Unit& other) const;
    Unit divide(const Unit& other) const;
    Unit power(int exponent) const;

    bool equals(const Unit& other) const { return prefixed_.equals(other.prefixed_); }
    bool isDimensionless() const { return getComposition().isDimensionless(); }

    // The alias if set, otherwise the canonical prefixed rendering.
    std::string render() const;

    // Typeset forms; an alias is written as a single symbol.
    std::string renderPretty() const;
    std::string renderLatex() const;

    // Copy carrying the first alias the registry holds for an equal unit
    // (unchanged when there is none).
    Unit withRegisteredAlias(const UnitAliasManager& registry) const;

private:
    Unit(std::string formula, PrefixedUnit prefixed, std::optional<std::string> alias);

    std::string formula_ = "1";
    PrefixedUnit prefixed_;
    std::optional<std::string> alias_;
};

inline bool operator==(const Unit& a, const Unit& b) { return a.equals(b); }
inline bool operator!=(const Unit& a, const Unit& b) { return !a.equals(b); }
inline Unit operator*(const Unit& a, const Unit& b) { return a.multiply(b); }
inline Unit operator/(const Unit& a, const Unit& b) { return a.divide(b); }
inline Unit pow(const Unit& unit, int exponent) { return unit.power(exponent); }

// Compares compositions only: m and km share a dimension.
inline bool sameDimension(const Unit& a, const Unit& b) {
    return a.getPrefixedUnit().sameDimension(b.getPrefixedUnit());
}

std::ostream& operator<<(std::ostream& os, const Unit& unit);

}  // namespace unitcalc
