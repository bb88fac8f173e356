#pragma once

#include "alias_manager.h"
#include "prefixed_unit.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace unitcalc {

// ============================================================================
// Tokens
// ============================================================================

enum class TokenType {
    Number,      // 1000, 2.5, 1e-3
    Identifier,  // kg, km, N, µm
    Star,        // *
    Power,       // ** or ^
    Slash,       // /
    LParen,
    RParen,
    LBracket,
    RBracket,
    Plus,
    Minus,
    Equals,
    End
};

struct Token {
    TokenType type;
    std::string text;
    std::size_t position;  // byte offset in the formula
};

// Splits a formula into tokens; the last one is always End.
// Throws LexError on a character that cannot start a token.
std::vector<Token> tokenize(const std::string& text);

std::string tokenTypeToString(TokenType type);

// ============================================================================
// Parse Result
// ============================================================================

struct ParsedFormula {
    std::optional<std::string> alias;  // "N" in "N = kg*m/s**2"
    std::string expression;            // right-hand side, trimmed
    PrefixedUnit unit;

    // Set when the expression is one unprefixed registry symbol ("N").
    std::optional<std::string> symbolAlias;
};

// ============================================================================
// Unit Parser
// ============================================================================

/**
 * @brief Recursive-descent parser for unit formulas.
 *
 *   formula  := [ alias "=" ] expr
 *   expr     := term ( ("*" | "/") term )*
 *   term     := factor ( ("**" | "^") exponent )?
 *   exponent := [ "+" | "-" ] integer
 *   factor   := "(" expr ")" | "[" expr "]" | number | symbol
 *
 * Symbols are resolved through the registry given at construction. The
 * parser never registers anything; Unit::parse() does that for aliases.
 * Failures are thrown as FormulaError subclasses carrying the position.
 */
class UnitParser {
public:
    explicit UnitParser(const UnitAliasManager& registry);
    ~UnitParser();

    ParsedFormula parse(const std::string& text) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

}  // namespace unitcalc
