#pragma once

#include "scale.h"
#include "unit_composition.h"
#include <string>
#include <utility>

namespace unitcalc {

/**
 * @brief Result of PrefixedUnit::bestPrefix().
 *
 * prefix + baseSymbol is the text of the leading rendered term ("k" + "m",
 * "m" + "g"). When no prefix can absorb the scale, prefix is empty and
 * residual holds the whole scale, to be written as a numeric coefficient.
 */
struct PrefixChoice {
    std::string prefix;
    std::string baseSymbol;
    Scale residual;

    bool isExact() const { return residual.isOne(); }
};

// ============================================================================
// PrefixedUnit
// ============================================================================

class PrefixedUnit {
public:
    PrefixedUnit() = default;
    explicit PrefixedUnit(UnitComposition composition, Scale scale = Scale())
        : composition_(std::move(composition)), scale_(scale) {}

    const UnitComposition& getComposition() const { return composition_; }
    const Scale& getScale() const { return scale_; }

    PrefixedUnit multiply(const PrefixedUnit& other) const;
    PrefixedUnit divide(const PrefixedUnit& other) const;
    PrefixedUnit power(int exponent) const;

    // Composition and scale must both match.
    bool equals(const PrefixedUnit& other) const;

    // Composition only, ignores the scale.
    bool sameDimension(const PrefixedUnit& other) const { return composition_ == other.composition_; }

    PrefixChoice bestPrefix() const;

    // "km", "kg*m/s^2", "3600*s", "1000"
    std::string render() const;

    // "km·s⁻¹" / "\text{km} \cdot \text{s}^{-1}", same prefix choice as render().
    std::string renderNotation(NotationStyle style) const;
    std::string renderPretty() const { return renderNotation(NotationStyle::Unicode); }
    std::string renderLatex() const { return renderNotation(NotationStyle::Latex); }

private:
    UnitComposition composition_;
    Scale scale_;
};

inline bool operator==(const PrefixedUnit& a, const PrefixedUnit& b) { return a.equals(b); }
inline bool operator!=(const PrefixedUnit& a, const PrefixedUnit& b) { return !a.equals(b); }
inline PrefixedUnit operator*(const PrefixedUnit& a, const PrefixedUnit& b) { return a.multiply(b); }
inline PrefixedUnit operator/(const PrefixedUnit& a, const PrefixedUnit& b) { return a.divide(b); }

}  // namespace unitcalc
