#include "unitcalc/fundamental_unit.h"
#include <map>

namespace unitcalc {

namespace {

struct FundamentalInfo {
    const char* symbol;
    const char* name;
};

const std::map<FundamentalUnit, FundamentalInfo> FUNDAMENTAL_TABLE = {
    {FundamentalUnit::Mass,              {"kg",  "mass"}},
    {FundamentalUnit::Angle,             {"rad", "angle"}},
    {FundamentalUnit::Length,            {"m",   "length"}},
    {FundamentalUnit::Time,              {"s",   "time"}},
    {FundamentalUnit::LuminousIntensity, {"cd",  "luminous intensity"}},
    {FundamentalUnit::Temperature,       {"K",   "temperature"}},
    {FundamentalUnit::Current,           {"A",   "electric current"}},
    {FundamentalUnit::AmountOfSubstance, {"mol", "amount of substance"}},
    {FundamentalUnit::Dimensionless,     {"1",   "dimensionless"}}
};

}  // namespace

const std::array<FundamentalUnit, 9> UNIT_ORDER = {
    FundamentalUnit::Mass,
    FundamentalUnit::Angle,
    FundamentalUnit::Length,
    FundamentalUnit::Time,
    FundamentalUnit::LuminousIntensity,
    FundamentalUnit::Temperature,
    FundamentalUnit::Current,
    FundamentalUnit::AmountOfSubstance,
    FundamentalUnit::Dimensionless
};

std::string fundamentalSymbol(FundamentalUnit unit) {
    return FUNDAMENTAL_TABLE.at(unit).symbol;
}

std::string fundamentalName(FundamentalUnit unit) {
    return FUNDAMENTAL_TABLE.at(unit).name;
}

std::optional<FundamentalUnit> fundamentalFromSymbol(const std::string& symbol) {
    for (const auto& [unit, info] : FUNDAMENTAL_TABLE) {
        if (symbol == info.symbol) return unit;
    }
    return std::nullopt;
}

int displayOrder(FundamentalUnit unit) {
    for (size_t i = 0; i < UNIT_ORDER.size(); ++i) {
        if (UNIT_ORDER[i] == unit) return static_cast<int>(i);
    }
    return static_cast<int>(UNIT_ORDER.size());
}

}  // namespace unitcalc
