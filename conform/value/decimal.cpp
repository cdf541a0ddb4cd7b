#include "decimal.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <numeric>
#include <string_view>
#include <system_error>

#include "conform/error/exception.hpp"

namespace conform::value {

namespace {
auto digitCount(std::uint64_t value) noexcept -> std::int64_t {
    std::int64_t count = 1;
    while (value >= 10) {
        value /= 10;
        ++count;
    }
    return count;
}

auto pow10(std::int64_t power) noexcept -> unsigned __int128 {
    unsigned __int128 result = 1;
    for (std::int64_t i = 0; i < power; ++i) {
        result *= 10;
    }
    return result;
}

// Magnitude ordering of two finite normalized decimals, ignoring sign.
auto compareMagnitude(std::uint64_t lhsCoef, std::int32_t lhsExp,
                      std::uint64_t rhsCoef,
                      std::int32_t rhsExp) noexcept -> std::strong_ordering {
    if (lhsCoef == 0 || rhsCoef == 0) {
        return (lhsCoef != 0) <=> (rhsCoef != 0);
    }
    const std::int64_t lhsDigits = digitCount(lhsCoef);
    const std::int64_t rhsDigits = digitCount(rhsCoef);
    const std::int64_t lhsAdjusted = lhsDigits - 1 + lhsExp;
    const std::int64_t rhsAdjusted = rhsDigits - 1 + rhsExp;
    if (lhsAdjusted != rhsAdjusted) {
        return lhsAdjusted <=> rhsAdjusted;
    }
    // Same leading power of ten: scaling the shorter coefficient up to the
    // longer one's digit count stays below 10^20.
    unsigned __int128 lhs = lhsCoef;
    unsigned __int128 rhs = rhsCoef;
    if (lhsExp > rhsExp) {
        lhs *= pow10(static_cast<std::int64_t>(lhsExp) - rhsExp);
    } else if (rhsExp > lhsExp) {
        rhs *= pow10(static_cast<std::int64_t>(rhsExp) - lhsExp);
    }
    if (lhs == rhs) {
        return std::strong_ordering::equal;
    }
    return lhs < rhs ? std::strong_ordering::less
                     : std::strong_ordering::greater;
}
}  // namespace

Decimal::Decimal(std::int64_t value) noexcept
    : coefficient_(value < 0 ? static_cast<std::uint64_t>(-(value + 1)) + 1
                             : static_cast<std::uint64_t>(value)),
      negative_(value < 0) {
    normalize();
}

Decimal::Decimal(std::uint64_t value) noexcept : coefficient_(value) {
    normalize();
}

Decimal::Decimal(double value) {
    if (!std::isfinite(value)) {
        finite_ = false;
        negative_ = std::signbit(value);
        approx_ = value;
        return;
    }

    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        finite_ = false;
        negative_ = std::signbit(value);
        approx_ = value;
        return;
    }

    std::string_view text(buffer, static_cast<std::size_t>(end - buffer));
    if (!text.empty() && text.front() == '-') {
        negative_ = true;
        text.remove_prefix(1);
    }

    std::string digits;
    std::int64_t exponent = 0;
    bool fraction = false;
    std::size_t pos = 0;
    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (c == '.') {
            fraction = true;
        } else if (c >= '0' && c <= '9') {
            digits.push_back(c);
            if (fraction) {
                --exponent;
            }
        } else {
            break;
        }
    }
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && text[pos] == '+') {
            ++pos;
        }
        int power = 0;
        std::from_chars(text.data() + pos, text.data() + text.size(), power);
        exponent += power;
    }

    while (!digits.empty() && digits.back() == '0') {
        digits.pop_back();
        ++exponent;
    }
    const auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        coefficient_ = 0;
        exponent_ = 0;
        negative_ = false;
        return;
    }
    digits.erase(0, first);

    auto [ptr, parseEc] = std::from_chars(
        digits.data(), digits.data() + digits.size(), coefficient_);
    if (parseEc != std::errc()) {
        finite_ = false;
        approx_ = value;
        return;
    }
    exponent_ = static_cast<std::int32_t>(exponent);
    normalize();
}

auto Decimal::fromValue(const Value& value) -> Decimal {
    if (value.is_number_unsigned()) {
        return Decimal(value.get<std::uint64_t>());
    }
    if (value.is_number_integer()) {
        return Decimal(value.get<std::int64_t>());
    }
    if (value.is_number_float()) {
        return Decimal(value.get<double>());
    }
    THROW_INVALID_ARGUMENT("Value of type {} is not a number",
                           value.type_name());
}

void Decimal::normalize() noexcept {
    if (coefficient_ == 0) {
        exponent_ = 0;
        negative_ = false;
        return;
    }
    while (coefficient_ % 10 == 0) {
        coefficient_ /= 10;
        ++exponent_;
    }
}

auto Decimal::isIntegral() const noexcept -> bool {
    return finite_ && (coefficient_ == 0 || exponent_ >= 0);
}

auto Decimal::isMultipleOf(const Decimal& divisor) const noexcept -> bool {
    if (!finite_ || !divisor.finite_ || divisor.coefficient_ == 0) {
        return false;
    }
    if (coefficient_ == 0) {
        return true;
    }
    // A normalized coefficient is never divisible by ten, so a quotient with
    // a negative power of ten left over cannot be whole.
    if (exponent_ < divisor.exponent_) {
        return false;
    }
    const std::int64_t shift =
        static_cast<std::int64_t>(exponent_) - divisor.exponent_;
    std::uint64_t rest =
        divisor.coefficient_ / std::gcd(coefficient_, divisor.coefficient_);
    for (std::int64_t twos = 0; twos < shift && rest % 2 == 0; ++twos) {
        rest /= 2;
    }
    for (std::int64_t fives = 0; fives < shift && rest % 5 == 0; ++fives) {
        rest /= 5;
    }
    return rest == 1;
}

auto Decimal::toDouble() const noexcept -> double {
    if (!finite_) {
        return approx_;
    }
    const std::string text = std::to_string(coefficient_) + "e" +
                             std::to_string(exponent_);
    const double magnitude = std::strtod(text.c_str(), nullptr);
    return negative_ ? -magnitude : magnitude;
}

auto Decimal::toString() const -> std::string {
    if (!finite_) {
        if (std::isnan(approx_)) {
            return "NaN";
        }
        return negative_ ? "-Infinity" : "Infinity";
    }

    std::string digits = std::to_string(coefficient_);
    std::string result = negative_ ? "-" : "";
    const auto length = static_cast<std::int64_t>(digits.size());

    if (exponent_ == 0) {
        return result + digits;
    }
    if (exponent_ > 0) {
        if (exponent_ <= 6) {
            return result + digits + std::string(exponent_, '0');
        }
        return result + digits + "E+" + std::to_string(exponent_);
    }

    const std::int64_t scale = -static_cast<std::int64_t>(exponent_);
    if (scale < length) {
        digits.insert(static_cast<std::size_t>(length - scale), 1, '.');
        return result + digits;
    }
    if (scale - length < 6) {
        return result + "0." +
               std::string(static_cast<std::size_t>(scale - length), '0') +
               digits;
    }
    return result + digits + "E" + std::to_string(exponent_);
}

auto operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept
    -> std::partial_ordering {
    if (!lhs.finite_ || !rhs.finite_) {
        return lhs.toDouble() <=> rhs.toDouble();
    }
    if (lhs.negative_ != rhs.negative_) {
        return lhs.negative_ ? std::partial_ordering::less
                             : std::partial_ordering::greater;
    }
    const auto magnitude = compareMagnitude(lhs.coefficient_, lhs.exponent_,
                                            rhs.coefficient_, rhs.exponent_);
    if (magnitude == std::strong_ordering::equal) {
        return std::partial_ordering::equivalent;
    }
    const bool lhsLarger = magnitude == std::strong_ordering::greater;
    return lhsLarger != lhs.negative_ ? std::partial_ordering::greater
                                      : std::partial_ordering::less;
}

auto operator==(const Decimal& lhs, const Decimal& rhs) noexcept -> bool {
    return (lhs <=> rhs) == std::partial_ordering::equivalent;
}

}  // namespace conform::value
