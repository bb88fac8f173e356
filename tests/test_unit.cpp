#include <catch2/catch_test_macros.hpp>
#include "unitcalc/derived_units.h"
#include "unitcalc/errors.h"
#include "unitcalc/unit.h"
#include <sstream>
#include <string>
#include <vector>

using namespace unitcalc;

TEST_CASE("Unit scenarios", "[unit]") {
    UnitAliasManager registry;

    SECTION("Kilogram") {
        Unit kg = Unit::parse("kg", registry);
        REQUIRE(kg.getComposition() == UnitComposition::fromFundamental(FundamentalUnit::Mass));
        REQUIRE(kg.getScale().isOne());
        REQUIRE(kg.render() == "kg");
        REQUIRE(kg.getFormula() == "kg");
        REQUIRE_FALSE(kg.getAlias().has_value());
    }

    SECTION("Newton from base units") {
        Unit n = Unit::parse("kg*m/s**2", registry);
        REQUIRE(n.getComposition() == UnitComposition({{FundamentalUnit::Mass, 1},
                                                       {FundamentalUnit::Length, 1},
                                                       {FundamentalUnit::Time, -2}}));
        REQUIRE(n.render() == "kg*m/s^2");
    }

    SECTION("Alias definition") {
        Unit defined = Unit::parse("N = kg*m/s**2", registry);
        REQUIRE(defined.getAlias() == std::string("N"));
        REQUIRE(registry.contains("N"));

        Unit n = Unit::parse("N", registry);
        REQUIRE(n == Unit::parse("kg*m/s**2", registry));
        REQUIRE(n.render() == "N");
        REQUIRE(n.getFormula() == "N");
    }

    SECTION("Kilometre") {
        Unit km = Unit::parse("km", registry);
        REQUIRE(km.getComposition() == UnitComposition::fromFundamental(FundamentalUnit::Length));
        REQUIRE(km.getScale() == Scale::powerOfTen(3));
        REQUIRE(km.getScale().value() == 1000.0);
        REQUIRE(km.render() == "km");
    }

    SECTION("Trailing plus") {
        REQUIRE_THROWS_AS(Unit::parse("kg +", registry), SyntaxError);
        try {
            Unit::parse("kg +", registry);
        } catch (const UnexpectedToken& e) {
            REQUIRE(e.getPosition() == 3);
        }
    }

    SECTION("Product of metre and second") {
        Unit ms = Unit::parse("m", registry).multiply(Unit::parse("s", registry));
        REQUIRE(ms.getComposition() == UnitComposition({{FundamentalUnit::Length, 1}, {FundamentalUnit::Time, 1}}));
        REQUIRE(ms.render() == "m*s");
    }
}

TEST_CASE("Unit arithmetic", "[unit]") {
    UnitAliasManager registry;
    Unit n = Unit::parse("N = kg*m/s**2", registry);
    Unit m = Unit::parse("m", registry);

    SECTION("Results carry a canonical formula and no alias") {
        Unit j = n * m;
        REQUIRE_FALSE(j.getAlias().has_value());
        REQUIRE(j.getFormula() == "kg*m^2/s^2");
        REQUIRE(j.render() == "kg*m^2/s^2");
    }

    SECTION("Division and power") {
        Unit pa = n / pow(m, 2);
        REQUIRE(pa.render() == "kg/(m*s^2)");
        REQUIRE(pow(m, 0).isDimensionless());
        REQUIRE((m / m).render() == "1");
    }

    SECTION("Operands are not modified") {
        Unit before = n;
        Unit product = n * m;
        REQUIRE(n.getFormula() == before.getFormula());
        REQUIRE(n.getAlias() == before.getAlias());
        REQUIRE(product != n);
    }

    SECTION("Registered alias can be recovered") {
        Unit force = Unit::parse("kg*m", registry) / Unit::parse("s^2", registry);
        REQUIRE(force.render() == "kg*m/s^2");
        REQUIRE(force.withRegisteredAlias(registry).render() == "N");
        REQUIRE(m.withRegisteredAlias(registry).render() == "m");
    }

    SECTION("Power overflow") {
        REQUIRE_THROWS_AS(m.power(1 << 16).power(1 << 16), InvalidExponent);
    }
}

TEST_CASE("Unit equality", "[unit]") {
    UnitAliasManager registry;

    SECTION("Different formulas, same unit") {
        Unit a = Unit::parse("kg*m/s**2", registry);
        Unit b = Unit::parse("m*kg*s^-2", registry);
        REQUIRE(a == b);
        REQUIRE(a.getFormula() != b.getFormula());
    }

    SECTION("Prefix makes a different value with the same dimension") {
        Unit m = Unit::parse("m", registry);
        Unit km = Unit::parse("km", registry);
        REQUIRE(m != km);
        REQUIRE(sameDimension(m, km));
        REQUIRE_FALSE(sameDimension(m, Unit::parse("s", registry)));
    }

    SECTION("Equivalent prefixed spellings") {
        REQUIRE(Unit::parse("1000*m", registry) == Unit::parse("km", registry));
        REQUIRE(Unit::parse("g", registry) == Unit::parse("1e-3*kg", registry));
        REQUIRE(Unit::parse("kkg", registry) == Unit::parse("Mg", registry));
    }
}

TEST_CASE("Unit factories", "[unit]") {
    Unit velocity = Unit::fromComposition(UnitComposition({{FundamentalUnit::Length, 1}, {FundamentalUnit::Time, -1}}));
    REQUIRE(velocity.getFormula() == "m/s");
    REQUIRE_FALSE(velocity.getAlias().has_value());

    Unit km = Unit::fromPrefixedUnit(PrefixedUnit(UnitComposition::fromFundamental(FundamentalUnit::Length),
                                                  Scale::powerOfTen(3)));
    REQUIRE(km.getFormula() == "km");

    Unit dimensionless;
    REQUIRE(dimensionless.isDimensionless());
    REQUIRE(dimensionless.render() == "1");

    std::ostringstream oss;
    oss << km;
    REQUIRE(oss.str() == "km");
}

TEST_CASE("Unit typeset notations", "[unit][render]") {
    UnitAliasManager registry;
    registerDerivedUnits(registry);

    SECTION("Prefixed expressions") {
        Unit speed = Unit::parse("km/s", registry);
        REQUIRE(speed.renderPretty() == "km·s⁻¹");
        REQUIRE(speed.renderLatex() == "\\text{km} \\cdot \\text{s}^{-1}");
        REQUIRE(Unit::parse("kg*m/s^2", registry).renderPretty() == "kg·m·s⁻²");
    }

    SECTION("Aliases stay a single symbol") {
        REQUIRE(Unit::parse("N", registry).renderPretty() == "N");
        REQUIRE(Unit::parse("N", registry).renderLatex() == "\\text{N}");
    }

    SECTION("Coefficients and dimensionless values") {
        Unit hour = Unit::fromPrefixedUnit(Unit::parse("h", registry).getPrefixedUnit());
        REQUIRE(hour.renderPretty() == "3600·s");
        REQUIRE(hour.renderLatex() == "3600 \\cdot \\text{s}");
        REQUIRE(Unit::parse("1000", registry).renderPretty() == "1000");
        REQUIRE(Unit().renderLatex() == "1");
    }
}

TEST_CASE("Alias conflicts through parse", "[unit][alias]") {
    UnitAliasManager registry;
    Unit::parse("N = kg*m/s**2", registry);
    REQUIRE_NOTHROW(Unit::parse("N = kg*m/s^2", registry));
    REQUIRE_THROWS_AS(Unit::parse("N = kg*m/s", registry), AliasConflict);
    REQUIRE_THROWS_AS(Unit::parse("m = km", registry), AliasConflict);
}

TEST_CASE("Render and parse round-trip", "[unit][render]") {
    UnitAliasManager registry;
    registerDerivedUnits(registry);

    const std::vector<std::string> formulas = {
        "kg", "m/s", "kg*m/s**2", "1/s", "kg/(s^3*A)", "km", "mg", "g", "kN", "MW/m^2",
        "dam", "µs", "um", "h", "min*m", "3600*s", "L", "bar", "atm", "eV", "cal", "deg",
        "°", "Ω*A", "kHz", "1000", "2.5", "1", "mol/L", "cd*rad", "K", "ton", "week",
        "km^2", "1e30*m", "month", "year", "km/49*49", "m**-3", "(kg*m)**2/(s^4*A^2)", "1e-3*m^2",
    };

    for (const auto& formula : formulas) {
        Unit u = Unit::parse(formula, registry);
        Unit reparsed = Unit::parse(u.render(), registry);
        INFO(formula << " -> " << u.render());
        REQUIRE(reparsed == u);

        Unit canonical = Unit::fromPrefixedUnit(u.getPrefixedUnit());
        REQUIRE(Unit::parse(canonical.render(), registry) == u);
    }
}

TEST_CASE("Derived unit catalogue", "[unit][derived]") {
    UnitAliasManager registry;
    int count = registerDerivedUnits(registry);
    REQUIRE(count == static_cast<int>(DerivedUnits::getAll().size()));
    REQUIRE(registry.size() == DerivedUnits::getAll().size());
    REQUIRE(DerivedUnits::isDerivedUnit("Pa"));
    REQUIRE_FALSE(DerivedUnits::isDerivedUnit("kg"));

    SECTION("Loading twice is a no-op") {
        REQUIRE_NOTHROW(registerDerivedUnits(registry));
        REQUIRE(registry.size() == DerivedUnits::getAll().size());
    }

    SECTION("SI derived units") {
        REQUIRE(Unit::parse("J", registry) == Unit::parse("kg*m^2/s^2", registry));
        REQUIRE(Unit::parse("W", registry) == Unit::parse("kg*m^2/s^3", registry));
        REQUIRE(Unit::parse("V", registry) == Unit::parse("kg*m^2/(s^3*A)", registry));
        REQUIRE(Unit::parse("Ω", registry) == Unit::parse("Ohm", registry));
        REQUIRE(Unit::parse("Hz", registry) == Unit::parse("1/s", registry));
        REQUIRE(Unit::parse("T", registry) == Unit::parse("Wb/m^2", registry));
        REQUIRE(Unit::parse("S", registry) == Unit::parse("1/Ohm", registry));
    }

    SECTION("Prefixed derived units") {
        Unit kn = Unit::parse("kN", registry);
        REQUIRE(kn.getScale() == Scale::powerOfTen(3));
        REQUIRE_FALSE(kn.getAlias().has_value());
        REQUIRE(Unit::parse("mg", registry).getScale() == Scale::powerOfTen(-6));
        REQUIRE(Unit::parse("kPa", registry) == Unit::parse("1000*Pa", registry));
    }

    SECTION("Multiples") {
        REQUIRE(Unit::parse("h", registry).getScale() == Scale(3600.0));
        REQUIRE(Unit::parse("day", registry).getScale() == Scale(86400.0));
        REQUIRE(Unit::parse("week", registry).getScale() == Scale(604800.0));
        REQUIRE(Unit::parse("month", registry).getScale() == Scale(2629800.0));
        REQUIRE(Unit::parse("year", registry).getScale() == Scale(31557600.0));
        REQUIRE(Unit::parse("12*month", registry) == Unit::parse("year", registry));
        REQUIRE(Unit::parse("L", registry) == Unit::parse("dm^3", registry));
        REQUIRE(Unit::parse("t", registry) == Unit::parse("Mg", registry));
        REQUIRE(Unit::parse("bar", registry) == Unit::parse("100*kPa", registry));
        REQUIRE(Unit::parse("deg", registry) == Unit::parse("°", registry));
    }

    SECTION("Aliases render by name, expressions canonically") {
        REQUIRE(Unit::parse("N", registry).render() == "N");
        REQUIRE(Unit::parse("h", registry).getPrefixedUnit().render() == "3600*s");
        REQUIRE(Unit::parse("L", registry).getPrefixedUnit().render() == "dm^3");
        REQUIRE(Unit::parse("Hz", registry).getPrefixedUnit().render() == "1/s");
    }

    SECTION("Catalogue symbols keep prefixes usable") {
        REQUIRE(Unit::parse("mm", registry).getScale() == Scale::powerOfTen(-3));
        REQUIRE(Unit::parse("mol", registry).getScale().isOne());
        REQUIRE(Unit::parse("dam", registry).getScale() == Scale::powerOfTen(1));
        REQUIRE(Unit::parse("hm", registry).getScale() == Scale::powerOfTen(2));
    }
}
