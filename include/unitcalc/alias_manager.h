#pragma once

#include "prefixed_unit.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace unitcalc {

/**
 * @brief How a formula symbol was resolved.
 *
 * "kN" gives prefix "k", base "N", isAlias true; "m" gives an empty prefix,
 * base "m", isAlias false.
 */
struct SymbolMatch {
    PrefixedUnit unit;
    std::string prefix;
    std::string base;
    bool isAlias = false;
};

// ============================================================================
// UnitAliasManager
// ============================================================================

/**
 * @brief Registry of named units ("N" -> kg*m/s^2).
 *
 * This is the only mutable shared state of the library. It is an ordinary
 * object: parsers take it by reference, tests build their own. Every member
 * takes the same mutex, so one instance may be shared between threads.
 */
class UnitAliasManager {
public:
    UnitAliasManager() = default;
    UnitAliasManager(const UnitAliasManager&) = delete;
    UnitAliasManager& operator=(const UnitAliasManager&) = delete;

    // Re-registering an equal unit is a no-op; a different one throws
    // AliasConflict. Invalid names throw SyntaxError.
    void registerAlias(const std::string& name, const PrefixedUnit& unit);

    // Throws UnknownAlias.
    PrefixedUnit resolve(const std::string& name) const;

    void unregister(const std::string& name);
    void clear();

    bool contains(const std::string& name) const;
    std::optional<PrefixedUnit> find(const std::string& name) const;

    // First registered name whose unit equals the given one.
    std::optional<std::string> aliasFor(const PrefixedUnit& unit) const;

    // Registration order.
    std::vector<std::string> names() const;
    std::vector<std::pair<std::string, PrefixedUnit>> entries() const;
    size_t size() const;

    // Resolves a formula symbol. A prefix is stripped only when the rest is
    // itself a known symbol ("da" is tried before "d"); otherwise the whole
    // symbol is looked up unprefixed.
    std::optional<SymbolMatch> lookupSymbol(const std::string& symbol) const;

    // Symbols every parser knows without registration: the fundamental
    // units plus the gram.
    static std::optional<PrefixedUnit> builtinSymbol(const std::string& symbol);

    static bool isValidName(const std::string& name);

private:
    std::optional<SymbolMatch> lookupBaseLocked(const std::string& symbol) const;
    std::optional<SymbolMatch> lookupPrefixedLocked(const std::string& symbol) const;

    mutable std::mutex mutex_;
    std::map<std::string, PrefixedUnit> aliases_;
    std::vector<std::string> order_;
};

}  // namespace unitcalc
