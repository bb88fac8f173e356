#pragma once

#include "alias_manager.h"
#include <string>

namespace unitcalc {

struct UnitOptions {
    bool loadDerivedUnits = true;      // Start with the derived unit catalogue
    bool verbose = false;              // Diagnostics on stderr
    std::string definitionsFile;       // Extra "NAME = formula" lines
    std::string outputFormat = "text"; // "text", "json", "pretty" or "latex"
};

bool isOutputFormat(const std::string& format);

/**
 * @brief Load options from a key/value file (unitcalc.conf).
 *
 * One "key = value" per line; '#' starts a comment; unknown keys are
 * ignored. Returns false if the file cannot be opened. A value that does
 * not fit its key throws std::runtime_error.
 */
bool loadOptionsFromFile(const std::string& filePath, UnitOptions& options);

/**
 * @brief Register the "NAME = formula" lines of a definitions file.
 *
 * '#' starts a comment; blank lines are skipped. Returns the number of
 * definitions read. Throws DefinitionFileError carrying the line number
 * when a line fails to parse or conflicts with the registry, and when the
 * file cannot be opened.
 */
int loadDefinitionsFromFile(const std::string& filePath, UnitAliasManager& registry);

}  // namespace unitcalc
