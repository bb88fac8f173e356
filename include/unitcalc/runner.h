#pragma once

#include "unitcalc/alias_manager.h"
#include "unitcalc/config.h"
#include "unitcalc/unit.h"
#include <optional>
#include <string>
#include <vector>

namespace unitcalc {

struct FormulaResult {
    std::string input;
    bool success = false;
    std::optional<Unit> unit;
    std::string errorMessage;
};

/**
 * @brief Evaluates a batch of formulas against one registry.
 *
 * The registry is prepared from the options (derived catalogue, then the
 * definitions file) and formulas are parsed in order, so an alias defined
 * by one formula is visible to the next. A failing formula is recorded and
 * does not stop the batch.
 */
class UnitCalcRunner {
public:
    explicit UnitCalcRunner(const UnitOptions& options);

    // True when the registry was prepared and every formula parsed.
    bool run(const std::vector<std::string>& formulas);

    struct Timing {
        double setup_time_ms = 0.0;
        double parse_time_ms = 0.0;
        double total_time_ms = 0.0;
    };

    const std::vector<FormulaResult>& getResults() const { return results_; }
    const UnitAliasManager& getRegistry() const { return registry_; }
    UnitAliasManager& getRegistry() { return registry_; }
    const Timing& getTiming() const { return timing_; }
    const std::string& getSetupError() const { return setupError_; }

    bool isSetupSuccess() const { return setupError_.empty(); }
    int getFailureCount() const;

    std::string generateReport() const;
    std::string generateRegistryReport() const;
    // One "input: rendering" line per formula in the given notation.
    std::string generateNotationReport(NotationStyle style) const;
    std::string generateJSON() const;

private:
    bool prepareRegistry();

    UnitOptions options_;
    UnitAliasManager registry_;
    bool registryReady_ = false;
    std::string setupError_;
    std::vector<FormulaResult> results_;
    Timing timing_;
};

}  // namespace unitcalc
