#include "unitcalc/alias_manager.h"
#include "unitcalc/errors.h"
#include "unitcalc/prefixes.h"
#include <algorithm>
#include <cctype>

namespace unitcalc {

std::optional<PrefixedUnit> UnitAliasManager::builtinSymbol(const std::string& symbol) {
    if (symbol == "g") {
        return PrefixedUnit(UnitComposition::fromFundamental(FundamentalUnit::Mass), Scale::powerOfTen(-3));
    }
    auto fundamental = fundamentalFromSymbol(symbol);
    if (!fundamental || *fundamental == FundamentalUnit::Dimensionless) {
        return std::nullopt;
    }
    return PrefixedUnit(UnitComposition::fromFundamental(*fundamental));
}

bool UnitAliasManager::isValidName(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        unsigned char uc = static_cast<unsigned char>(c);
        return std::isalpha(uc) || c == '_' || uc >= 0x80;
    });
}

void UnitAliasManager::registerAlias(const std::string& name, const PrefixedUnit& unit) {
    if (!isValidName(name)) {
        throw SyntaxError("invalid alias name", FormulaError::npos, name);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (auto builtin = builtinSymbol(name)) {
        if (*builtin == unit) return;
        throw AliasConflict(name, builtin->render(), unit.render());
    }

    auto it = aliases_.find(name);
    if (it != aliases_.end()) {
        if (it->second == unit) return;
        throw AliasConflict(name, it->second.render(), unit.render());
    }

    // The prefixed reading of a symbol wins over a bare alias, so refuse
    // names that could never be reached ("km" = 5 m).
    if (auto shadow = lookupPrefixedLocked(name)) {
        if (shadow->unit != unit) {
            throw AliasConflict(name, "already reads as " + shadow->prefix + " + " + shadow->base +
                                      " = " + shadow->unit.render());
        }
    }

    // Likewise a new base symbol must not change what an existing alias means
    // ("a" would turn "Pa" into peta-a).
    for (const auto& prefix : Prefixes::getAll()) {
        std::string combined = prefix.symbol + name;
        if (aliases_.count(combined) || builtinSymbol(combined)) {
            throw AliasConflict(name, "would make '" + combined + "' read as " + prefix.symbol + " + " + name);
        }
    }

    aliases_.emplace(name, unit);
    order_.push_back(name);
}

PrefixedUnit UnitAliasManager::resolve(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aliases_.find(name);
    if (it == aliases_.end()) {
        throw UnknownAlias(name);
    }
    return it->second;
}

void UnitAliasManager::unregister(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (aliases_.erase(name) > 0) {
        order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    }
}

void UnitAliasManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    aliases_.clear();
    order_.clear();
}

bool UnitAliasManager::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aliases_.count(name) > 0;
}

std::optional<PrefixedUnit> UnitAliasManager::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aliases_.find(name);
    if (it == aliases_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> UnitAliasManager::aliasFor(const PrefixedUnit& unit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& name : order_) {
        if (aliases_.at(name) == unit) return name;
    }
    return std::nullopt;
}

std::vector<std::string> UnitAliasManager::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

std::vector<std::pair<std::string, PrefixedUnit>> UnitAliasManager::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, PrefixedUnit>> result;
    result.reserve(order_.size());
    for (const auto& name : order_) {
        result.emplace_back(name, aliases_.at(name));
    }
    return result;
}

size_t UnitAliasManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aliases_.size();
}

std::optional<SymbolMatch> UnitAliasManager::lookupSymbol(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto match = lookupPrefixedLocked(symbol)) return match;
    return lookupBaseLocked(symbol);
}

std::optional<SymbolMatch> UnitAliasManager::lookupBaseLocked(const std::string& symbol) const {
    if (auto builtin = builtinSymbol(symbol)) {
        return SymbolMatch{*builtin, "", symbol, false};
    }
    auto it = aliases_.find(symbol);
    if (it != aliases_.end()) {
        return SymbolMatch{it->second, "", symbol, true};
    }
    return std::nullopt;
}

std::optional<SymbolMatch> UnitAliasManager::lookupPrefixedLocked(const std::string& symbol) const {
    for (const auto& prefix : Prefixes::getAll()) {
        const std::string& p = prefix.symbol;
        if (symbol.size() <= p.size() || symbol.compare(0, p.size(), p) != 0) continue;

        auto base = lookupBaseLocked(symbol.substr(p.size()));
        if (!base) continue;

        PrefixedUnit scaled(base->unit.getComposition(),
                            base->unit.getScale() * Scale::powerOfTen(prefix.decade));
        return SymbolMatch{scaled, p, base->base, base->isAlias};
    }
    return std::nullopt;
}

}  // namespace unitcalc
