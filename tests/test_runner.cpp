#include <catch2/catch_test_macros.hpp>
#include "unitcalc/runner.h"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace unitcalc;

TEST_CASE("Runner evaluates formulas in order", "[runner]") {
    UnitOptions options;
    options.loadDerivedUnits = false;
    UnitCalcRunner runner(options);

    bool ok = runner.run({"N = kg*m/s**2", "kN", "W/m^2"});
    REQUIRE_FALSE(ok);

    const auto& results = runner.getResults();
    REQUIRE(results.size() == 3);
    REQUIRE(results[0].success);
    REQUIRE(results[0].unit->getAlias() == std::string("N"));
    REQUIRE(results[1].success);
    REQUIRE(results[1].unit->getScale() == Scale::powerOfTen(3));

    // W is not defined without the derived catalogue
    REQUIRE_FALSE(results[2].success);
    REQUIRE(results[2].errorMessage.find("UnknownUnitSymbol") != std::string::npos);
    REQUIRE(runner.getFailureCount() == 1);
}

TEST_CASE("Runner with the derived catalogue", "[runner]") {
    UnitCalcRunner runner(UnitOptions{});
    REQUIRE(runner.run({"kN*m", "h"}));
    REQUIRE(runner.isSetupSuccess());
    REQUIRE(runner.getRegistry().contains("Pa"));
    REQUIRE(runner.getFailureCount() == 0);

    std::string report = runner.generateReport();
    REQUIRE(report.find("kN*m") != std::string::npos);
    REQUIRE(report.find("3600*s") != std::string::npos);
    REQUIRE(report.find("alias:       h") != std::string::npos);

    std::string listing = runner.generateRegistryReport();
    REQUIRE(listing.find("Pa") != std::string::npos);

    auto j = nlohmann::json::parse(runner.generateJSON());
    REQUIRE(j["results"].size() == 2);
    REQUIRE(j["failures"] == 0);
    REQUIRE(j["results"][1]["unit"]["alias"] == "h");
}

TEST_CASE("Runner notation reports", "[runner]") {
    UnitCalcRunner runner(UnitOptions{});
    REQUIRE_FALSE(runner.run({"km/s", "N", "foo"}));

    std::string pretty = runner.generateNotationReport(NotationStyle::Unicode);
    REQUIRE(pretty.find("km/s: km·s⁻¹\n") != std::string::npos);
    REQUIRE(pretty.find("N: N\n") != std::string::npos);
    REQUIRE(pretty.find("foo: error: UnknownUnitSymbol") != std::string::npos);

    std::string latex = runner.generateNotationReport(NotationStyle::Latex);
    REQUIRE(latex.find("km/s: $\\text{km} \\cdot \\text{s}^{-1}$\n") != std::string::npos);
    REQUIRE(latex.find("N: $\\text{N}$\n") != std::string::npos);
}

TEST_CASE("Runner reports definition file failures", "[runner]") {
    fs::path defsPath = fs::temp_directory_path() / "unitcalc_runner_bad.def";
    {
        std::ofstream f(defsPath);
        f << "X = nope\n";
    }

    UnitOptions options;
    options.definitionsFile = defsPath.string();
    UnitCalcRunner runner(options);
    REQUIRE_FALSE(runner.run({"m"}));
    fs::remove(defsPath);

    REQUIRE_FALSE(runner.isSetupSuccess());
    REQUIRE(runner.getSetupError().find(":1:") != std::string::npos);
    REQUIRE(runner.getResults().empty());
}

TEST_CASE("Runner JSON for failures", "[runner]") {
    UnitOptions options;
    options.loadDerivedUnits = false;
    UnitCalcRunner runner(options);
    runner.run({"kg @"});

    auto j = nlohmann::json::parse(runner.generateJSON());
    REQUIRE(j["failures"] == 1);
    REQUIRE(j["results"][0]["success"] == false);
    REQUIRE(j["results"][0]["error"].get<std::string>().find("LexError") != std::string::npos);
}
