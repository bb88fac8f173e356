#include "unitcalc/config.h"
#include "unitcalc/errors.h"
#include "unitcalc/unit.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace unitcalc {

namespace {

void trimInPlace(std::string& s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.erase(0, 1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
}

void stripComment(std::string& line) {
    size_t commentPos = line.find('#');
    if (commentPos != std::string::npos) {
        line = line.substr(0, commentPos);
    }
}

bool parseBool(const std::string& key, std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw std::runtime_error("Invalid boolean for '" + key + "': " + value);
}

}  // namespace

bool isOutputFormat(const std::string& format) {
    return format == "text" || format == "json" || format == "pretty" || format == "latex";
}

bool loadOptionsFromFile(const std::string& filePath, UnitOptions& options) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        stripComment(line);
        trimInPlace(line);
        if (line.empty()) continue;

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) continue;

        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);
        trimInPlace(key);
        trimInPlace(value);

        if (key == "loadDerivedUnits") {
            options.loadDerivedUnits = parseBool(key, value);
        } else if (key == "verbose") {
            options.verbose = parseBool(key, value);
        } else if (key == "definitionsFile") {
            options.definitionsFile = value;
        } else if (key == "outputFormat") {
            if (!isOutputFormat(value)) {
                throw std::runtime_error("Invalid outputFormat: " + value +
                                         " (expected text, json, pretty or latex)");
            }
            options.outputFormat = value;
        }
    }
    return true;
}

int loadDefinitionsFromFile(const std::string& filePath, UnitAliasManager& registry) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw DefinitionFileError(filePath, 0, "cannot open file");
    }

    int count = 0;
    int lineNumber = 0;
    std::string line;
    while (std::getline(file, line)) {
        ++lineNumber;
        stripComment(line);
        trimInPlace(line);
        if (line.empty()) continue;

        if (line.find('=') == std::string::npos) {
            throw DefinitionFileError(filePath, lineNumber, "expected NAME = formula");
        }

        try {
            Unit::parse(line, registry);
        } catch (const UnitError& e) {
            throw DefinitionFileError(filePath, lineNumber, e.what());
        }
        ++count;
    }
    return count;
}

}  // namespace unitcalc
