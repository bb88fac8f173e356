#pragma once

#include <optional>
#include <string>

namespace unitcalc {

// Relative tolerance used when comparing scales that are not pure powers of ten.
constexpr double kScaleRelativeTolerance = 1e-9;

/**
 * @brief Positive multiplicative factor stored as mantissa * 10^decade.
 *
 * The decade is an integer, so products and powers of decimal prefixes stay
 * exact. An integral mantissa never carries trailing decimal zeros
 * (3600 is stored as 36 * 10^2), which makes pure powers of ten have a
 * mantissa of exactly 1.
 */
class Scale {
public:
    Scale() = default;

    // Throws std::invalid_argument unless mantissa is finite and > 0.
    explicit Scale(double mantissa, int decade = 0);

    static Scale powerOfTen(int decade);

    // Parses a decimal literal ("1000", "2.5", "1e-3") digit by digit.
    // Returns nullopt for malformed, zero or out-of-range literals.
    static std::optional<Scale> fromDecimalString(const std::string& text);

    double getMantissa() const { return mantissa_; }
    int getDecade() const { return decade_; }
    double value() const;

    bool isPowerOfTen() const { return mantissa_ == 1.0; }
    bool isOne() const { return mantissa_ == 1.0 && decade_ == 0; }

    Scale operator*(const Scale& other) const;
    Scale operator/(const Scale& other) const;

    // Throws InvalidExponent if the resulting decade does not fit in an int.
    Scale pow(int exponent) const;

    // Exact for pure powers of ten, relative tolerance otherwise.
    bool operator==(const Scale& other) const;
    bool operator!=(const Scale& other) const { return !(*this == other); }

    // Decimal text that fromDecimalString() reads back to an equal scale.
    std::string toString() const;

private:
    void normalize();

    double mantissa_ = 1.0;
    int decade_ = 0;
};

}  // namespace unitcalc
