#pragma once

#include <optional>
#include <string>
#include <vector>

namespace unitcalc {

struct PrefixInfo {
    std::string symbol;  // "k", "da", "µ"
    int decade;          // power of ten: 3, 1, -6
    std::string name;    // "kilo"
};

class Prefixes {
public:
    // All prefixes; two-letter symbols are listed before the one-letter ones.
    static const std::vector<PrefixInfo>& getAll();

    // Decade for a prefix symbol ("u" and "µ" both give -6).
    static std::optional<int> getDecade(const std::string& symbol);

    // Preferred symbol for a decade; the empty prefix for 0.
    static std::optional<std::string> symbolForDecade(int decade);

private:
    static const std::vector<PrefixInfo> registry_;
};

}  // namespace unitcalc
