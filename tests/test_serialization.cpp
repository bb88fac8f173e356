#include <catch2/catch_test_macros.hpp>
#include "unitcalc/derived_units.h"
#include "unitcalc/serialization.h"
#include "unitcalc/unit.h"
#include <nlohmann/json.hpp>

using namespace unitcalc;
using json = nlohmann::json;

TEST_CASE("Unit JSON", "[json]") {
    UnitAliasManager registry;

    SECTION("Plain formula") {
        Unit unit = Unit::parse("kg*m/s**2", registry);
        json j = json::parse(generateUnitJSON(unit));

        REQUIRE(j["formula"] == "kg*m/s**2");
        REQUIRE(j["render"] == "kg*m/s^2");
        REQUIRE(j["pretty"] == "kg·m·s⁻²");
        REQUIRE(j["latex"] == "\\text{kg} \\cdot \\text{m} \\cdot \\text{s}^{-2}");
        REQUIRE(j["alias"].is_null());
        REQUIRE(j["scale"] == "1");
        REQUIRE(j["scaleValue"] == 1.0);
        REQUIRE(j["composition"]["kg"] == 1);
        REQUIRE(j["composition"]["m"] == 1);
        REQUIRE(j["composition"]["s"] == -2);
        REQUIRE(j["composition"].size() == 3);
    }

    SECTION("Alias and scale") {
        Unit::parse("N = kg*m/s**2", registry);
        Unit kn = Unit::parse("kN", registry);
        json j = json::parse(generateUnitJSON(kn));
        REQUIRE(j["alias"].is_null());
        REQUIRE(j["scale"] == "1000");
        REQUIRE(j["scaleValue"] == 1000.0);

        json named = json::parse(generateUnitJSON(Unit::parse("N", registry)));
        REQUIRE(named["alias"] == "N");
        REQUIRE(named["render"] == "N");
    }

    SECTION("Dimensionless") {
        json j = json::parse(generateUnitJSON(Unit::parse("1000", registry)));
        REQUIRE(j["composition"].is_object());
        REQUIRE(j["composition"].empty());
        REQUIRE(j["render"] == "1000");
    }

    SECTION("Compact output") {
        std::string text = generateUnitJSON(Unit::parse("m", registry), -1);
        REQUIRE(text.find('\n') == std::string::npos);
    }
}

TEST_CASE("Registry JSON", "[json]") {
    UnitAliasManager registry;
    registerDerivedUnits(registry);

    json j = json::parse(generateRegistryJSON(registry));
    REQUIRE(j.is_array());
    REQUIRE(j.size() == registry.size());

    // Sorted by name
    for (size_t i = 1; i < j.size(); ++i) {
        REQUIRE(j[i - 1]["name"].get<std::string>() < j[i]["name"].get<std::string>());
    }

    bool foundHour = false;
    for (const auto& entry : j) {
        if (entry["name"] == "h") {
            foundHour = true;
            REQUIRE(entry["render"] == "3600*s");
            REQUIRE(entry["pretty"] == "3600·s");
            REQUIRE(entry["scale"] == "3600");
            REQUIRE(entry["composition"]["s"] == 1);
        }
    }
    REQUIRE(foundHour);

    UnitAliasManager empty;
    REQUIRE(json::parse(generateRegistryJSON(empty)).empty());
}
