#include "unitcalc/unit_composition.h"
#include "unitcalc/errors.h"
#include <limits>

namespace unitcalc {

namespace {

std::string formatTerm(const std::string& symbol, int exponent) {
    if (exponent == 1) return symbol;
    return symbol + "^" + std::to_string(exponent);
}

int checkedExponent(FundamentalUnit unit, long long exponent) {
    if (exponent > std::numeric_limits<int>::max() || exponent < std::numeric_limits<int>::min()) {
        throw InvalidExponent("exponent of " + fundamentalSymbol(unit) + " overflows",
                              FormulaError::npos, std::to_string(exponent));
    }
    return static_cast<int>(exponent);
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

// Shared by the three public render overloads.
std::string renderTerms(const std::vector<UnitComposition::Term>& terms,
                        const std::string* leadingSymbol,
                        const std::string& coefficient) {
    std::vector<UnitComposition::Term> numerator;
    std::vector<UnitComposition::Term> denominator;
    for (const auto& term : terms) {
        if (term.second > 0) {
            numerator.push_back(term);
        } else {
            denominator.push_back(term);
        }
    }

    std::vector<std::string> numParts;
    std::vector<std::string> denParts;
    bool leadingDone = false;
    auto symbolFor = [&](FundamentalUnit unit) {
        if (leadingSymbol && !leadingDone) {
            leadingDone = true;
            return *leadingSymbol;
        }
        return fundamentalSymbol(unit);
    };

    for (const auto& [unit, exponent] : numerator) {
        numParts.push_back(formatTerm(symbolFor(unit), exponent));
    }
    for (const auto& [unit, exponent] : denominator) {
        denParts.push_back(formatTerm(symbolFor(unit), -exponent));
    }

    std::string numText = join(numParts, "*");
    if (!coefficient.empty()) {
        numText = numText.empty() ? coefficient : coefficient + "*" + numText;
    }
    if (numText.empty()) numText = fundamentalSymbol(FundamentalUnit::Dimensionless);
    if (denParts.empty()) return numText;

    std::string denText = join(denParts, "*");
    if (denParts.size() > 1) denText = "(" + denText + ")";
    return numText + "/" + denText;
}

const char* const kSuperscriptDigits[] = {"⁰", "¹", "²", "³", "⁴", "⁵", "⁶", "⁷", "⁸", "⁹"};

std::string superscript(int exponent) {
    std::string result = exponent < 0 ? "⁻" : "";
    for (char c : std::to_string(exponent)) {
        if (c != '-') result += kSuperscriptDigits[c - '0'];
    }
    return result;
}

std::string formatNotationTerm(NotationStyle style, const std::string& symbol, int exponent) {
    if (style == NotationStyle::Unicode) {
        return exponent == 1 ? symbol : symbol + superscript(exponent);
    }
    std::string text = "\\text{" + symbol + "}";
    if (exponent != 1) text += "^{" + std::to_string(exponent) + "}";
    return text;
}

}  // namespace

UnitComposition::UnitComposition(const ExponentMap& exponents) {
    for (const auto& [unit, exponent] : exponents) {
        if (exponent != 0 && unit != FundamentalUnit::Dimensionless) {
            exponents_[unit] = exponent;
        }
    }
}

UnitComposition::UnitComposition(std::initializer_list<Term> terms)
    : UnitComposition(ExponentMap(terms.begin(), terms.end())) {}

UnitComposition UnitComposition::fromFundamental(FundamentalUnit unit, int exponent) {
    return UnitComposition(ExponentMap{{unit, exponent}});
}

int UnitComposition::getExponent(FundamentalUnit unit) const {
    auto it = exponents_.find(unit);
    return it != exponents_.end() ? it->second : 0;
}

std::vector<UnitComposition::Term> UnitComposition::terms() const {
    std::vector<Term> result;
    for (FundamentalUnit unit : UNIT_ORDER) {
        int exponent = getExponent(unit);
        if (exponent != 0) result.emplace_back(unit, exponent);
    }
    return result;
}

std::optional<UnitComposition::Term> UnitComposition::leadingTerm() const {
    auto ordered = terms();
    for (const auto& term : ordered) {
        if (term.second > 0) return term;
    }
    if (!ordered.empty()) return ordered.front();
    return std::nullopt;
}

UnitComposition UnitComposition::multiply(const UnitComposition& other) const {
    ExponentMap result = exponents_;
    for (const auto& [unit, exponent] : other.exponents_) {
        result[unit] = checkedExponent(unit, static_cast<long long>(result[unit]) + exponent);
    }
    return UnitComposition(result);
}

UnitComposition UnitComposition::divide(const UnitComposition& other) const {
    ExponentMap result = exponents_;
    for (const auto& [unit, exponent] : other.exponents_) {
        result[unit] = checkedExponent(unit, static_cast<long long>(result[unit]) - exponent);
    }
    return UnitComposition(result);
}

UnitComposition UnitComposition::power(int exponent) const {
    if (exponent == 0) return UnitComposition();

    ExponentMap result;
    for (const auto& [unit, current] : exponents_) {
        result[unit] = checkedExponent(unit, static_cast<long long>(current) * exponent);
    }
    return UnitComposition(result);
}

std::string UnitComposition::render() const {
    return renderTerms(terms(), nullptr, "");
}

std::string UnitComposition::render(const std::string& leadingSymbol) const {
    return renderTerms(terms(), &leadingSymbol, "");
}

std::string UnitComposition::renderWithCoefficient(const std::string& coefficient) const {
    return renderTerms(terms(), nullptr, coefficient);
}

std::string UnitComposition::renderNotation(NotationStyle style, const std::string& leadingSymbol,
                                            const std::string& coefficient) const {
    std::vector<std::string> parts;
    if (!coefficient.empty()) parts.push_back(coefficient);

    const auto leading = leadingTerm();
    for (const auto& [unit, exponent] : terms()) {
        bool prefixed = !leadingSymbol.empty() && leading && leading->first == unit;
        parts.push_back(formatNotationTerm(style, prefixed ? leadingSymbol : fundamentalSymbol(unit), exponent));
    }

    if (parts.empty()) return fundamentalSymbol(FundamentalUnit::Dimensionless);
    return join(parts, style == NotationStyle::Unicode ? "·" : " \\cdot ");
}

}  // namespace unitcalc
