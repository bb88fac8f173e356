#include "unitcalc/parser.h"
#include "unitcalc/errors.h"
#include <cctype>
#include <limits>

namespace unitcalc {

namespace {

// Deepest group nesting accepted by the parser.
constexpr int kMaxGroupDepth = 256;

}  // namespace

// ============================================================================
// Lexer
// ============================================================================

namespace {

bool isIdentifierByte(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) || c == '_' || uc >= 0x80;
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Length of the numeric literal starting at text[start]. The exponent part
// is taken only when at least one digit follows "e", "e+" or "e-".
std::size_t scanNumber(const std::string& text, std::size_t start) {
    std::size_t i = start;
    const std::size_t n = text.size();
    while (i < n && isDigit(text[i])) ++i;
    if (i + 1 < n && text[i] == '.' && isDigit(text[i + 1])) {
        ++i;
        while (i < n && isDigit(text[i])) ++i;
    }
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        std::size_t j = i + 1;
        if (j < n && (text[j] == '+' || text[j] == '-')) ++j;
        if (j < n && isDigit(text[j])) {
            i = j;
            while (i < n && isDigit(text[i])) ++i;
        }
    }
    return i - start;
}

}  // namespace

std::vector<Token> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    std::size_t i = 0;
    const std::size_t n = text.size();

    while (i < n) {
        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        if (isDigit(c)) {
            std::size_t len = scanNumber(text, i);
            tokens.push_back({TokenType::Number, text.substr(i, len), i});
            i += len;
            continue;
        }

        if (isIdentifierByte(c)) {
            std::size_t start = i;
            while (i < n && isIdentifierByte(text[i])) ++i;
            tokens.push_back({TokenType::Identifier, text.substr(start, i - start), start});
            continue;
        }

        switch (c) {
            case '*':
                if (i + 1 < n && text[i + 1] == '*') {
                    tokens.push_back({TokenType::Power, "**", i});
                    i += 2;
                } else {
                    tokens.push_back({TokenType::Star, "*", i++});
                }
                break;
            case '^': tokens.push_back({TokenType::Power, "^", i++}); break;
            case '/': tokens.push_back({TokenType::Slash, "/", i++}); break;
            case '(': tokens.push_back({TokenType::LParen, "(", i++}); break;
            case ')': tokens.push_back({TokenType::RParen, ")", i++}); break;
            case '[': tokens.push_back({TokenType::LBracket, "[", i++}); break;
            case ']': tokens.push_back({TokenType::RBracket, "]", i++}); break;
            case '+': tokens.push_back({TokenType::Plus, "+", i++}); break;
            case '-': tokens.push_back({TokenType::Minus, "-", i++}); break;
            case '=': tokens.push_back({TokenType::Equals, "=", i++}); break;
            default:
                throw LexError("illegal character", i, std::string(1, c));
        }
    }

    tokens.push_back({TokenType::End, "", n});
    return tokens;
}

std::string tokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::Number: return "number";
        case TokenType::Identifier: return "identifier";
        case TokenType::Star: return "'*'";
        case TokenType::Power: return "'**'";
        case TokenType::Slash: return "'/'";
        case TokenType::LParen: return "'('";
        case TokenType::RParen: return "')'";
        case TokenType::LBracket: return "'['";
        case TokenType::RBracket: return "']'";
        case TokenType::Plus: return "'+'";
        case TokenType::Minus: return "'-'";
        case TokenType::Equals: return "'='";
        case TokenType::End: return "end of formula";
    }
    return "unknown";
}

// ============================================================================
// Parser Implementation
// ============================================================================

class UnitParser::Impl {
public:
    explicit Impl(const UnitAliasManager& registry) : registry_(registry) {}

    ParsedFormula parse(const std::string& text) const {
        Cursor cursor{tokenize(text), 0};
        ParsedFormula result;

        const auto& tokens = cursor.tokens;
        if (tokens.size() >= 3 && tokens[0].type == TokenType::Identifier &&
            tokens[1].type == TokenType::Equals) {
            result.alias = tokens[0].text;
            cursor.index = 2;
        }
        const std::size_t start = cursor.index;

        const Token& first = cursor.peek();
        if (first.type == TokenType::End) {
            throw SyntaxError(result.alias ? "missing definition" : "empty formula", first.position);
        }

        result.unit = parseExpr(cursor);

        const Token& trailing = cursor.peek();
        if (trailing.type != TokenType::End) {
            throw UnexpectedToken(trailing.position, trailing.text);
        }

        result.expression = trim(text.substr(first.position));

        // A lone registry symbol keeps its name ("N" stays "N").
        if (cursor.index == start + 1 && first.type == TokenType::Identifier) {
            auto match = registry_.lookupSymbol(first.text);
            if (match && match->isAlias && match->prefix.empty()) {
                result.symbolAlias = match->base;
            }
        }
        return result;
    }

private:
    struct Cursor {
        std::vector<Token> tokens;
        std::size_t index;
        int depth = 0;

        const Token& peek() const { return tokens[index]; }
        const Token& next() { return tokens[index++]; }
        bool at(TokenType type) const { return tokens[index].type == type; }
    };

    static std::string trim(const std::string& s) {
        std::size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        std::size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    PrefixedUnit parseExpr(Cursor& cursor) const {
        PrefixedUnit left = parseTerm(cursor);
        while (cursor.at(TokenType::Star) || cursor.at(TokenType::Slash)) {
            const Token& op = cursor.next();
            PrefixedUnit right = parseTerm(cursor);
            try {
                left = op.type == TokenType::Slash ? left.divide(right) : left.multiply(right);
            } catch (const InvalidExponent&) {
                throw InvalidExponent("exponent out of range", op.position, op.text);
            }
        }
        return left;
    }

    PrefixedUnit parseTerm(Cursor& cursor) const {
        PrefixedUnit base = parseFactor(cursor);
        if (!cursor.at(TokenType::Power)) return base;

        const Token& op = cursor.next();
        int exponent = parseExponent(cursor, op);
        try {
            return base.power(exponent);
        } catch (const InvalidExponent&) {
            throw InvalidExponent("exponent out of range", op.position, std::to_string(exponent));
        }
    }

    int parseExponent(Cursor& cursor, const Token& op) const {
        bool negative = false;
        std::string signText;
        if (cursor.at(TokenType::Plus) || cursor.at(TokenType::Minus)) {
            const Token& sign = cursor.next();
            negative = sign.type == TokenType::Minus;
            signText = sign.text;
        }

        const Token& token = cursor.peek();
        if (token.type != TokenType::Number) {
            throw InvalidExponent("missing exponent after " + op.text, token.position, token.text);
        }
        cursor.next();

        for (char c : token.text) {
            if (!isDigit(c)) {
                throw InvalidExponent("exponent must be an integer", token.position, token.text);
            }
        }

        long long value = 0;
        for (char c : token.text) {
            value = value * 10 + (c - '0');
            if (value > std::numeric_limits<int>::max()) {
                throw InvalidExponent("exponent out of range", token.position, signText + token.text);
            }
        }
        return static_cast<int>(negative ? -value : value);
    }

    PrefixedUnit parseFactor(Cursor& cursor) const {
        const Token& token = cursor.peek();
        switch (token.type) {
            case TokenType::LParen:
            case TokenType::LBracket: {
                cursor.next();
                if (++cursor.depth > kMaxGroupDepth) {
                    throw SyntaxError("nesting too deep", token.position, token.text);
                }
                TokenType closing = token.type == TokenType::LParen ? TokenType::RParen : TokenType::RBracket;
                PrefixedUnit inner = parseExpr(cursor);
                const Token& end = cursor.peek();
                if (end.type == TokenType::End) {
                    throw SyntaxError("unterminated group", token.position, token.text);
                }
                if (end.type != closing) {
                    throw UnexpectedToken(end.position, end.text);
                }
                cursor.next();
                --cursor.depth;
                return inner;
            }
            case TokenType::Number: {
                cursor.next();
                auto scale = Scale::fromDecimalString(token.text);
                if (!scale) {
                    throw SyntaxError("invalid numeric factor", token.position, token.text);
                }
                return PrefixedUnit(UnitComposition(), *scale);
            }
            case TokenType::Identifier: {
                cursor.next();
                auto match = registry_.lookupSymbol(token.text);
                if (!match) {
                    throw UnknownUnitSymbol(token.text, token.position);
                }
                return match->unit;
            }
            case TokenType::End:
                throw SyntaxError("missing operand", token.position);
            default:
                throw UnexpectedToken(token.position, token.text);
        }
    }

    const UnitAliasManager& registry_;
};

// ============================================================================
// Public Interface
// ============================================================================

UnitParser::UnitParser(const UnitAliasManager& registry) : pImpl(std::make_unique<Impl>(registry)) {}
UnitParser::~UnitParser() = default;

ParsedFormula UnitParser::parse(const std::string& text) const {
    return pImpl->parse(text);
}

}  // namespace unitcalc
