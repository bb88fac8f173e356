#include "unitcalc/runner.h"
#include "unitcalc/derived_units.h"
#include "unitcalc/errors.h"
#include "unitcalc/serialization.h"
#include <chrono>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

namespace unitcalc {

namespace {

std::string describeComposition(const UnitComposition& composition) {
    if (composition.isDimensionless()) return "dimensionless";
    std::ostringstream oss;
    bool first = true;
    for (const auto& [unit, exponent] : composition.terms()) {
        if (!first) oss << ", ";
        oss << fundamentalName(unit) << "^" << exponent;
        first = false;
    }
    return oss.str();
}

}  // namespace

UnitCalcRunner::UnitCalcRunner(const UnitOptions& options)
    : options_(options) {}

bool UnitCalcRunner::prepareRegistry() {
    if (registryReady_) return true;
    try {
        if (options_.loadDerivedUnits) {
            registerDerivedUnits(registry_);
        }
        if (!options_.definitionsFile.empty()) {
            loadDefinitionsFromFile(options_.definitionsFile, registry_);
        }
    } catch (const UnitError& e) {
        setupError_ = e.what();
        return false;
    }
    registryReady_ = true;
    return true;
}

bool UnitCalcRunner::run(const std::vector<std::string>& formulas) {
    auto start = std::chrono::high_resolution_clock::now();

    auto t1 = std::chrono::high_resolution_clock::now();
    bool ready = prepareRegistry();
    auto t2 = std::chrono::high_resolution_clock::now();
    timing_.setup_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();
    if (!ready) return false;

    t1 = std::chrono::high_resolution_clock::now();
    bool allOk = true;
    for (const auto& formula : formulas) {
        FormulaResult result;
        result.input = formula;
        try {
            result.unit = Unit::parse(formula, registry_);
            result.success = true;
        } catch (const UnitError& e) {
            result.errorMessage = e.what();
            allOk = false;
        }
        results_.push_back(std::move(result));
    }
    t2 = std::chrono::high_resolution_clock::now();
    timing_.parse_time_ms = std::chrono::duration<double, std::milli>(t2 - t1).count();

    auto end = std::chrono::high_resolution_clock::now();
    timing_.total_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return allOk;
}

int UnitCalcRunner::getFailureCount() const {
    int count = 0;
    for (const auto& result : results_) {
        if (!result.success) ++count;
    }
    return count;
}

std::string UnitCalcRunner::generateReport() const {
    std::ostringstream oss;
    for (const auto& result : results_) {
        oss << result.input << "\n";
        if (!result.success) {
            oss << "  error:       " << result.errorMessage << "\n";
            continue;
        }
        const Unit& unit = *result.unit;
        oss << "  canonical:   " << unit.getPrefixedUnit().render() << "\n";
        if (unit.getAlias()) {
            oss << "  alias:       " << *unit.getAlias() << "\n";
        }
        oss << "  base units:  " << unit.getComposition().render() << "\n";
        oss << "  dimension:   " << describeComposition(unit.getComposition()) << "\n";
        oss << "  scale:       " << unit.getScale().toString() << "\n";
    }
    return oss.str();
}

std::string UnitCalcRunner::generateRegistryReport() const {
    std::ostringstream oss;
    auto entries = registry_.entries();
    oss << "Registered units (" << entries.size() << "):\n";
    for (const auto& [name, unit] : entries) {
        oss << "  " << std::left << std::setw(8) << name << " = " << unit.render() << "\n";
    }
    return oss.str();
}

std::string UnitCalcRunner::generateNotationReport(NotationStyle style) const {
    std::ostringstream oss;
    for (const auto& result : results_) {
        oss << result.input << ": ";
        if (!result.success) {
            oss << "error: " << result.errorMessage << "\n";
        } else if (style == NotationStyle::Latex) {
            oss << "$" << result.unit->renderLatex() << "$\n";
        } else {
            oss << result.unit->renderPretty() << "\n";
        }
    }
    return oss.str();
}

std::string UnitCalcRunner::generateJSON() const {
    nlohmann::json j;
    nlohmann::json resultsJson = nlohmann::json::array();
    for (const auto& result : results_) {
        nlohmann::json r;
        r["input"] = result.input;
        r["success"] = result.success;
        if (result.success) {
            r["unit"] = nlohmann::json::parse(generateUnitJSON(*result.unit));
        } else {
            r["error"] = result.errorMessage;
        }
        resultsJson.push_back(r);
    }
    j["results"] = resultsJson;
    j["failures"] = getFailureCount();
    if (!setupError_.empty()) {
        j["setupError"] = setupError_;
    }
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace unitcalc
