#include "unitcalc/unit.h"
#include "unitcalc/parser.h"
#include <utility>

namespace unitcalc {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}  // namespace

Unit::Unit(std::string formula, PrefixedUnit prefixed, std::optional<std::string> alias)
    : formula_(std::move(formula)), prefixed_(std::move(prefixed)), alias_(std::move(alias)) {}

Unit Unit::parse(const std::string& text, UnitAliasManager& registry) {
    UnitParser parser(registry);
    ParsedFormula parsed = parser.parse(text);

    std::optional<std::string> alias = parsed.symbolAlias;
    if (parsed.alias) {
        registry.registerAlias(*parsed.alias, parsed.unit);
        alias = parsed.alias;
    }
    return Unit(trim(text), parsed.unit, alias);
}

Unit Unit::fromComposition(const UnitComposition& composition) {
    return fromPrefixedUnit(PrefixedUnit(composition));
}

Unit Unit::fromPrefixedUnit(const PrefixedUnit& unit) {
    return Unit(unit.render(), unit, std::nullopt);
}

Unit Unit::multiply(const Unit& other) const {
    return fromPrefixedUnit(prefixed_.multiply(other.prefixed_));
}

Unit Unit::divide(const Unit& other) const {
    return fromPrefixedUnit(prefixed_.divide(other.prefixed_));
}

Unit Unit::power(int exponent) const {
    return fromPrefixedUnit(prefixed_.power(exponent));
}

std::string Unit::render() const {
    if (alias_) return *alias_;
    return prefixed_.render();
}

std::string Unit::renderPretty() const {
    if (alias_) return *alias_;
    return prefixed_.renderPretty();
}

std::string Unit::renderLatex() const {
    if (alias_) return "\\text{" + *alias_ + "}";
    return prefixed_.renderLatex();
}

Unit Unit::withRegisteredAlias(const UnitAliasManager& registry) const {
    auto alias = registry.aliasFor(prefixed_);
    if (!alias) return *this;
    return Unit(formula_, prefixed_, alias);
}

std::ostream& operator<<(std::ostream& os, const Unit& unit) {
    return os << unit.render();
}

}  // namespace unitcalc
