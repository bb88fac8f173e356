#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace unitcalc {

// ============================================================================
// Error hierarchy
// ============================================================================

class UnitError : public std::runtime_error {
public:
    explicit UnitError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Base for failures that can be located inside a formula string.
 *
 * Position is a 0-based byte offset into the text handed to the parser,
 * or npos when the failure did not come from parsing (e.g. power()).
 */
class FormulaError : public UnitError {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    FormulaError(const std::string& kind, const std::string& msg,
                 std::size_t position = npos, const std::string& token = "")
        : UnitError(format(kind, msg, position, token)),
          position_(position), token_(token) {}

    std::size_t getPosition() const { return position_; }
    const std::string& getToken() const { return token_; }

private:
    static std::string format(const std::string& kind, const std::string& msg,
                              std::size_t position, const std::string& token) {
        std::string text = kind + ": " + msg;
        if (!token.empty()) text += " '" + token + "'";
        if (position != npos) text += " at position " + std::to_string(position);
        return text;
    }

    std::size_t position_;
    std::string token_;
};

class LexError : public FormulaError {
public:
    LexError(const std::string& msg, std::size_t position, const std::string& token)
        : FormulaError("LexError", msg, position, token) {}
};

class SyntaxError : public FormulaError {
public:
    SyntaxError(const std::string& msg, std::size_t position = npos, const std::string& token = "")
        : FormulaError("SyntaxError", msg, position, token) {}

protected:
    SyntaxError(const std::string& kind, const std::string& msg, std::size_t position,
                const std::string& token)
        : FormulaError(kind, msg, position, token) {}
};

class UnexpectedToken : public SyntaxError {
public:
    UnexpectedToken(std::size_t position, const std::string& token)
        : SyntaxError("UnexpectedToken", "unexpected token", position, token) {}
};

class UnknownUnitSymbol : public FormulaError {
public:
    UnknownUnitSymbol(const std::string& symbol, std::size_t position = npos)
        : FormulaError("UnknownUnitSymbol", "unknown unit symbol", position, symbol) {}
};

class InvalidExponent : public FormulaError {
public:
    explicit InvalidExponent(const std::string& msg, std::size_t position = npos,
                             const std::string& token = "")
        : FormulaError("InvalidExponent", msg, position, token) {}
};

class UnknownAlias : public UnitError {
public:
    explicit UnknownAlias(const std::string& name)
        : UnitError("UnknownAlias: no unit registered as '" + name + "'"), name_(name) {}

    const std::string& getName() const { return name_; }

private:
    std::string name_;
};

class AliasConflict : public UnitError {
public:
    AliasConflict(const std::string& name, const std::string& existing, const std::string& requested)
        : UnitError("AliasConflict: '" + name + "' is already defined as " + existing +
                    ", cannot redefine it as " + requested),
          name_(name) {}

    AliasConflict(const std::string& name, const std::string& reason)
        : UnitError("AliasConflict: '" + name + "' " + reason), name_(name) {}

    const std::string& getName() const { return name_; }

private:
    std::string name_;
};

// Raised while loading a definitions file; wraps the underlying message.
class DefinitionFileError : public UnitError {
public:
    DefinitionFileError(const std::string& path, int line, const std::string& msg)
        : UnitError(path + ":" + std::to_string(line) + ": " + msg), line_(line) {}

    int getLine() const { return line_; }

private:
    int line_;
};

}  // namespace unitcalc
