#include "unitcalc/serialization.h"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace unitcalc {

namespace {

nlohmann::json compositionToJson(const UnitComposition& composition) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [unit, exponent] : composition.terms()) {
        j[fundamentalSymbol(unit)] = exponent;
    }
    return j;
}

void addPrefixedUnit(nlohmann::json& j, const PrefixedUnit& unit) {
    j["render"] = unit.render();
    j["pretty"] = unit.renderPretty();
    j["latex"] = unit.renderLatex();
    j["scale"] = unit.getScale().toString();
    j["scaleValue"] = unit.getScale().value();
    j["composition"] = compositionToJson(unit.getComposition());
}

}  // namespace

std::string generateUnitJSON(const Unit& unit, int indent) {
    nlohmann::json j;
    j["formula"] = unit.getFormula();
    addPrefixedUnit(j, unit.getPrefixedUnit());
    j["render"] = unit.render();
    j["pretty"] = unit.renderPretty();
    j["latex"] = unit.renderLatex();
    if (unit.getAlias()) {
        j["alias"] = *unit.getAlias();
    } else {
        j["alias"] = nullptr;
    }
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string generateRegistryJSON(const UnitAliasManager& registry, int indent) {
    auto entries = registry.entries();
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    nlohmann::json j = nlohmann::json::array();
    for (const auto& [name, unit] : entries) {
        nlohmann::json entry;
        entry["name"] = name;
        addPrefixedUnit(entry, unit);
        j.push_back(entry);
    }
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace unitcalc
