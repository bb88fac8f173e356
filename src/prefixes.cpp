#include "unitcalc/prefixes.h"

namespace unitcalc {

// "da" must precede "d"; within a decade the first entry is the preferred
// spelling used for rendering.
const std::vector<PrefixInfo> Prefixes::registry_ = {
    {"da", 1,   "deca"},
    {"Y",  24,  "yotta"},
    {"Z",  21,  "zetta"},
    {"E",  18,  "exa"},
    {"P",  15,  "peta"},
    {"T",  12,  "tera"},
    {"G",  9,   "giga"},
    {"M",  6,   "mega"},
    {"k",  3,   "kilo"},
    {"h",  2,   "hecto"},
    {"d",  -1,  "deci"},
    {"c",  -2,  "centi"},
    {"m",  -3,  "milli"},
    {"µ",  -6,  "micro"},
    {"u",  -6,  "micro"},
    {"n",  -9,  "nano"},
    {"p",  -12, "pico"},
    {"f",  -15, "femto"},
    {"a",  -18, "atto"},
    {"z",  -21, "zepto"},
    {"y",  -24, "yocto"}
};

const std::vector<PrefixInfo>& Prefixes::getAll() {
    return registry_;
}

std::optional<int> Prefixes::getDecade(const std::string& symbol) {
    for (const auto& prefix : registry_) {
        if (prefix.symbol == symbol) return prefix.decade;
    }
    return std::nullopt;
}

std::optional<std::string> Prefixes::symbolForDecade(int decade) {
    if (decade == 0) return std::string();
    for (const auto& prefix : registry_) {
        if (prefix.decade == decade) return prefix.symbol;
    }
    return std::nullopt;
}

}  // namespace unitcalc
