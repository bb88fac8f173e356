#include "unitcalc/scale.h"
#include "unitcalc/errors.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace unitcalc {

namespace {

// Largest integer a double holds exactly (2^53).
constexpr double kMaxExactInteger = 9007199254740992.0;

int checkedDecade(long long decade) {
    if (decade > std::numeric_limits<int>::max() || decade < std::numeric_limits<int>::min()) {
        throw InvalidExponent("scale decade out of range: " + std::to_string(decade));
    }
    return static_cast<int>(decade);
}

bool isIntegral(double value) {
    return value < kMaxExactInteger && std::floor(value) == value;
}

}  // namespace

Scale::Scale(double mantissa, int decade) : mantissa_(mantissa), decade_(decade) {
    if (!std::isfinite(mantissa) || mantissa <= 0.0) {
        throw std::invalid_argument("Scale mantissa must be finite and positive");
    }
    normalize();
}

Scale Scale::powerOfTen(int decade) {
    return Scale(1.0, decade);
}

void Scale::normalize() {
    // Rounding noise from products and quotients ("km/49*49") is dropped
    // so the mantissa lands back on its integer.
    double nearest = std::round(mantissa_);
    if (nearest >= 1.0 && nearest < kMaxExactInteger &&
        std::fabs(mantissa_ - nearest) <= kScaleRelativeTolerance * nearest) {
        mantissa_ = nearest;
    }
    if (!isIntegral(mantissa_)) return;
    while (mantissa_ >= 10.0 && std::fmod(mantissa_, 10.0) == 0.0) {
        mantissa_ /= 10.0;
        decade_ = checkedDecade(static_cast<long long>(decade_) + 1);
    }
}

std::optional<Scale> Scale::fromDecimalString(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();
    std::string intDigits;
    std::string fracDigits;

    while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) intDigits += text[i++];
    if (i < n && text[i] == '.') {
        ++i;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) fracDigits += text[i++];
    }
    if (intDigits.empty() && fracDigits.empty()) return std::nullopt;

    long long exponent = 0;
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        int sign = 1;
        if (i < n && (text[i] == '+' || text[i] == '-')) {
            if (text[i] == '-') sign = -1;
            ++i;
        }
        if (i >= n || !std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) {
            exponent = exponent * 10 + (text[i++] - '0');
            if (exponent > 1000000) return std::nullopt;
        }
        exponent *= sign;
    }
    if (i != n) return std::nullopt;

    std::string digits = intDigits + fracDigits;
    long long decade = exponent - static_cast<long long>(fracDigits.size());

    size_t firstNonZero = digits.find_first_not_of('0');
    if (firstNonZero == std::string::npos) return std::nullopt;  // zero is not a valid scale
    digits.erase(0, firstNonZero);
    while (digits.back() == '0') {
        digits.pop_back();
        ++decade;
    }
    if (decade > std::numeric_limits<int>::max() || decade < std::numeric_limits<int>::min()) {
        return std::nullopt;
    }

    errno = 0;
    double mantissa = std::strtod(digits.c_str(), nullptr);
    if (errno == ERANGE || !std::isfinite(mantissa)) return std::nullopt;
    return Scale(mantissa, static_cast<int>(decade));
}

double Scale::value() const {
    return mantissa_ * std::pow(10.0, decade_);
}

Scale Scale::operator*(const Scale& other) const {
    double mantissa = mantissa_ * other.mantissa_;
    if (!std::isfinite(mantissa) || mantissa <= 0.0) {
        throw InvalidExponent("scale product out of range");
    }
    return Scale(mantissa, checkedDecade(static_cast<long long>(decade_) + other.decade_));
}

Scale Scale::operator/(const Scale& other) const {
    double mantissa = mantissa_ / other.mantissa_;
    if (!std::isfinite(mantissa) || mantissa <= 0.0) {
        throw InvalidExponent("scale quotient out of range");
    }
    return Scale(mantissa, checkedDecade(static_cast<long long>(decade_) - other.decade_));
}

Scale Scale::pow(int exponent) const {
    if (exponent == 0) return Scale();
    int decade = checkedDecade(static_cast<long long>(decade_) * exponent);
    double mantissa = mantissa_ == 1.0 ? 1.0 : std::pow(mantissa_, exponent);
    if (!std::isfinite(mantissa) || mantissa <= 0.0) {
        throw InvalidExponent("scale power out of range", FormulaError::npos,
                              std::to_string(exponent));
    }
    return Scale(mantissa, decade);
}

bool Scale::operator==(const Scale& other) const {
    if (mantissa_ == 1.0 && other.mantissa_ == 1.0) {
        return decade_ == other.decade_;
    }
    double shift = static_cast<double>(decade_) - static_cast<double>(other.decade_);
    double ratio = (mantissa_ / other.mantissa_) * std::pow(10.0, shift);
    return std::fabs(ratio - 1.0) <= kScaleRelativeTolerance;
}

std::string Scale::toString() const {
    if (isIntegral(mantissa_)) {
        std::string digits = std::to_string(static_cast<long long>(mantissa_));
        long long size = static_cast<long long>(digits.size());
        if (decade_ >= 0 && size + decade_ <= 16) {
            return digits + std::string(static_cast<size_t>(decade_), '0');
        }
        if (decade_ < 0 && -static_cast<long long>(decade_) < size) {
            digits.insert(static_cast<size_t>(size + decade_), ".");
            return digits;
        }
        if (decade_ < 0 && -static_cast<long long>(decade_) <= size + 4) {
            return "0." + std::string(static_cast<size_t>(-decade_ - size), '0') + digits;
        }
        return digits + "e" + std::to_string(decade_);
    }

    // Shortest text that reads back to the same mantissa, in d.ddd form
    std::string text;
    for (int precision = 15; precision <= 17; ++precision) {
        std::ostringstream oss;
        oss << std::scientific << std::setprecision(precision - 1) << mantissa_;
        text = oss.str();
        if (std::stod(text) == mantissa_) break;
    }

    size_t ePos = text.find_first_of("eE");
    long long exponent = static_cast<long long>(decade_) + std::stoll(text.substr(ePos + 1));
    std::string digits = text.substr(0, ePos);
    digits.erase(1, 1);  // decimal point
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

    const long long size = static_cast<long long>(digits.size());
    if (exponent >= 0 && exponent < 16) {
        if (size <= exponent + 1) {
            return digits + std::string(static_cast<size_t>(exponent + 1 - size), '0');
        }
        digits.insert(static_cast<size_t>(exponent + 1), ".");
        return digits;
    }
    if (exponent < 0 && exponent >= -5) {
        return "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
    }
    std::string result = digits.substr(0, 1);
    if (size > 1) result += "." + digits.substr(1);
    return result + "e" + std::to_string(exponent);
}

}  // namespace unitcalc
