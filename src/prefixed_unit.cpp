#include "unitcalc/prefixed_unit.h"
#include "unitcalc/prefixes.h"
#include <optional>

namespace unitcalc {

namespace {

// Mass is rendered through the gram so that 1e-6 kg reads "mg", not "µkg".
constexpr int kKilogramDecade = 3;
const char* const kGramSymbol = "g";

}  // namespace

PrefixedUnit PrefixedUnit::multiply(const PrefixedUnit& other) const {
    return PrefixedUnit(composition_.multiply(other.composition_), scale_ * other.scale_);
}

PrefixedUnit PrefixedUnit::divide(const PrefixedUnit& other) const {
    return PrefixedUnit(composition_.divide(other.composition_), scale_ / other.scale_);
}

PrefixedUnit PrefixedUnit::power(int exponent) const {
    return PrefixedUnit(composition_.power(exponent), scale_.pow(exponent));
}

bool PrefixedUnit::equals(const PrefixedUnit& other) const {
    return composition_ == other.composition_ && scale_ == other.scale_;
}

PrefixChoice PrefixedUnit::bestPrefix() const {
    auto leading = composition_.leadingTerm();
    if (!leading) {
        return {"", fundamentalSymbol(FundamentalUnit::Dimensionless), scale_};
    }

    const FundamentalUnit unit = leading->first;
    const int exponent = leading->second;
    std::string base = fundamentalSymbol(unit);
    if (!scale_.isPowerOfTen()) {
        return {"", base, scale_};
    }

    const long long decade = scale_.getDecade();

    // A prefix of decade p on a term with exponent e contributes 10^(p*e).
    auto fits = [exponent](long long target) -> std::optional<std::string> {
        if (target % exponent != 0) return std::nullopt;
        long long p = target / exponent;
        if (p < -100 || p > 100) return std::nullopt;
        return Prefixes::symbolForDecade(static_cast<int>(p));
    };

    if (unit == FundamentalUnit::Mass) {
        if (auto prefix = fits(decade + static_cast<long long>(kKilogramDecade) * exponent)) {
            return {*prefix, kGramSymbol, Scale()};
        }
    }
    if (auto prefix = fits(decade)) {
        return {*prefix, base, Scale()};
    }
    return {"", base, scale_};
}

std::string PrefixedUnit::render() const {
    if (composition_.isDimensionless()) {
        return scale_.toString();
    }
    PrefixChoice choice = bestPrefix();
    if (choice.isExact()) {
        return composition_.render(choice.prefix + choice.baseSymbol);
    }
    return composition_.renderWithCoefficient(scale_.toString());
}

std::string PrefixedUnit::renderNotation(NotationStyle style) const {
    if (composition_.isDimensionless()) {
        return scale_.toString();
    }
    PrefixChoice choice = bestPrefix();
    if (choice.isExact()) {
        return composition_.renderNotation(style, choice.prefix + choice.baseSymbol);
    }
    return composition_.renderNotation(style, "", scale_.toString());
}

}  // namespace unitcalc
