#include "unitcalc/config.h"
#include "unitcalc/runner.h"
#include "unitcalc/serialization.h"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <formula>...\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --config <file>     Options file (key = value lines)\n";
    std::cerr << "  -d, --define <file>     Definitions file (NAME = formula lines)\n";
    std::cerr << "  -f, --format <format>   Output format: text, json, pretty, latex (default: text)\n";
    std::cerr << "  --no-derived            Start with an empty unit registry\n";
    std::cerr << "  --list                  Print the registered units\n";
    std::cerr << "  -v, --verbose           Print diagnostics to stderr\n";
    std::cerr << "  -h, --help              Show this help message\n\n";
    std::cerr << "Example: " << programName << " \"N = kg*m/s**2\" kN \"W/m^2\"\n";
}

int main(int argc, char* argv[]) {
    std::vector<std::string> formulas;
    std::string configFile;
    std::optional<std::string> definitionsFile;
    std::optional<std::string> format;
    bool noDerived = false;
    bool listUnits = false;
    bool verbose = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--no-derived") {
            noDerived = true;
        } else if (arg == "--list") {
            listUnits = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            } else {
                std::cerr << "Error: -c requires an argument\n";
                return 1;
            }
        } else if (arg == "-d" || arg == "--define") {
            if (i + 1 < argc) {
                definitionsFile = argv[++i];
            } else {
                std::cerr << "Error: -d requires an argument\n";
                return 1;
            }
        } else if (arg == "-f" || arg == "--format") {
            if (i + 1 < argc) {
                format = argv[++i];
            } else {
                std::cerr << "Error: -f requires an argument\n";
                return 1;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        } else {
            formulas.push_back(arg);
        }
    }

    if (formulas.empty() && !listUnits) {
        std::cerr << "Error: No formula specified\n";
        printUsage(argv[0]);
        return 1;
    }

    // Options file first, command line flags override it
    unitcalc::UnitOptions options;
    if (!configFile.empty()) {
        try {
            if (!unitcalc::loadOptionsFromFile(configFile, options)) {
                std::cerr << "Error: Could not open config file: " << configFile << "\n";
                return 1;
            }
        } catch (const std::runtime_error& e) {
            std::cerr << "Error: " << configFile << ": " << e.what() << "\n";
            return 1;
        }
    }
    if (definitionsFile) options.definitionsFile = *definitionsFile;
    if (format) options.outputFormat = *format;
    if (noDerived) options.loadDerivedUnits = false;
    if (verbose) options.verbose = true;

    if (!unitcalc::isOutputFormat(options.outputFormat)) {
        std::cerr << "Unknown format: " << options.outputFormat << "\n";
        return 1;
    }

    unitcalc::UnitCalcRunner runner(options);
    bool runSuccess = runner.run(formulas);

    if (!runner.isSetupSuccess()) {
        std::cerr << "Error: " << runner.getSetupError() << "\n";
        return 1;
    }

    if (options.verbose) {
        std::cerr << "Registry: " << runner.getRegistry().size() << " units";
        if (!options.definitionsFile.empty()) {
            std::cerr << " (definitions from " << options.definitionsFile << ")";
        }
        std::cerr << "\n";
        std::cerr << "Timing: setup " << runner.getTiming().setup_time_ms << " ms, parse "
                  << runner.getTiming().parse_time_ms << " ms\n";
    }

    for (const auto& result : runner.getResults()) {
        if (!result.success) {
            std::cerr << "Error: " << result.errorMessage << "\n";
        }
    }

    if (options.outputFormat == "json") {
        if (listUnits) {
            std::cout << unitcalc::generateRegistryJSON(runner.getRegistry()) << "\n";
        }
        if (!formulas.empty()) {
            std::cout << runner.generateJSON() << "\n";
        }
    } else {
        if (listUnits) {
            std::cout << runner.generateRegistryReport();
        }
        if (options.outputFormat == "pretty") {
            std::cout << runner.generateNotationReport(unitcalc::NotationStyle::Unicode);
        } else if (options.outputFormat == "latex") {
            std::cout << runner.generateNotationReport(unitcalc::NotationStyle::Latex);
        } else {
            std::cout << runner.generateReport();
        }
    }

    return runSuccess ? 0 : 1;
}
