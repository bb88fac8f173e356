#pragma once

#include "fundamental_unit.h"
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace unitcalc {

// Typeset notations besides the parseable canonical text.
enum class NotationStyle {
    Unicode,  // kg·m·s⁻²
    Latex     // \text{kg} \cdot \text{m} \cdot \text{s}^{-2}
};

// ============================================================================
// UnitComposition
// ============================================================================

/**
 * @brief Exponent vector of a derived unit over the fundamental units.
 *
 * Stored sparsely: zero exponents and the Dimensionless entry are never kept,
 * so two compositions are equal exactly when their maps are equal. The empty
 * composition is the dimensionless unit "1".
 */
class UnitComposition {
public:
    using ExponentMap = std::map<FundamentalUnit, int>;
    using Term = std::pair<FundamentalUnit, int>;

    UnitComposition() = default;
    explicit UnitComposition(const ExponentMap& exponents);
    UnitComposition(std::initializer_list<Term> terms);

    static UnitComposition fromFundamental(FundamentalUnit unit, int exponent = 1);

    int getExponent(FundamentalUnit unit) const;
    const ExponentMap& getExponents() const { return exponents_; }
    bool isDimensionless() const { return exponents_.empty(); }

    // Non-zero terms in UNIT_ORDER.
    std::vector<Term> terms() const;

    // The term a prefix attaches to when rendering: the first numerator term,
    // or the first denominator term when there is no numerator.
    std::optional<Term> leadingTerm() const;

    // All three throw InvalidExponent when a resulting exponent does not fit in an int.
    UnitComposition multiply(const UnitComposition& other) const;
    UnitComposition divide(const UnitComposition& other) const;
    UnitComposition power(int exponent) const;

    bool operator==(const UnitComposition& other) const { return exponents_ == other.exponents_; }
    bool operator!=(const UnitComposition& other) const { return !(*this == other); }

    // Canonical text, e.g. "kg*m/s^2", "1/s", "kg/(s^3*A)", "1".
    std::string render() const;

    // Same as render() but the leading term's symbol is replaced by
    // leadingSymbol (used to attach prefixes: "km", "mg").
    std::string render(const std::string& leadingSymbol) const;

    // "<coefficient>*<numerator>/<denominator>"; a lone coefficient when
    // the composition is dimensionless.
    std::string renderWithCoefficient(const std::string& coefficient) const;

    // Flat product with signed exponents, no division sign. leadingSymbol
    // and coefficient behave as above; an empty string leaves them out.
    std::string renderNotation(NotationStyle style, const std::string& leadingSymbol = "",
                               const std::string& coefficient = "") const;
    std::string renderPretty() const { return renderNotation(NotationStyle::Unicode); }
    std::string renderLatex() const { return renderNotation(NotationStyle::Latex); }

private:
    ExponentMap exponents_;
};

inline UnitComposition operator*(const UnitComposition& a, const UnitComposition& b) {
    return a.multiply(b);
}

inline UnitComposition operator/(const UnitComposition& a, const UnitComposition& b) {
    return a.divide(b);
}

}  // namespace unitcalc
