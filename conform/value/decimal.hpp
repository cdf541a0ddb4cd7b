#ifndef CONFORM_VALUE_DECIMAL_HPP
#define CONFORM_VALUE_DECIMAL_HPP

#include <compare>
#include <cstdint>
#include <string>

#include "conform/value/value.hpp"

namespace conform::value {

/**
 * @brief Exact decimal view of a numeric Value.
 *
 * The number is stored as `(-1)^negative * coefficient * 10^exponent` and kept
 * normalized: the coefficient carries no trailing zeros and zero is always
 * positive with exponent 0. Integers convert exactly. Floating point values
 * convert through their shortest round-trip decimal representation, so a
 * parsed `0.1` is exactly one tenth rather than the nearest binary fraction.
 *
 * Non-finite doubles cannot be represented exactly; they keep only their
 * double value and compare through it.
 */
class Decimal {
public:
    constexpr Decimal() noexcept = default;

    explicit Decimal(std::int64_t value) noexcept;
    explicit Decimal(std::uint64_t value) noexcept;
    explicit Decimal(double value);

    /**
     * @brief Converts a numeric Value.
     * @throws conform::error::InvalidArgument if the value is not a number.
     */
    [[nodiscard]] static auto fromValue(const Value& value) -> Decimal;

    [[nodiscard]] auto isZero() const noexcept -> bool {
        return finite_ && coefficient_ == 0;
    }
    [[nodiscard]] auto isNegative() const noexcept -> bool {
        return negative_;
    }
    [[nodiscard]] auto isFinite() const noexcept -> bool { return finite_; }

    /**
     * @brief True when the fractional part is exactly zero.
     */
    [[nodiscard]] auto isIntegral() const noexcept -> bool;

    /**
     * @brief True when this value is an exact integer multiple of divisor.
     * Always false for a zero or non-finite divisor.
     */
    [[nodiscard]] auto isMultipleOf(const Decimal& divisor) const noexcept
        -> bool;

    [[nodiscard]] auto coefficient() const noexcept -> std::uint64_t {
        return coefficient_;
    }
    [[nodiscard]] auto exponent() const noexcept -> std::int32_t {
        return exponent_;
    }

    [[nodiscard]] auto toDouble() const noexcept -> double;

    /**
     * @brief Plain decimal text, e.g. "-12.5" or "3E+20".
     */
    [[nodiscard]] auto toString() const -> std::string;

    friend auto operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept
        -> std::partial_ordering;
    friend auto operator==(const Decimal& lhs, const Decimal& rhs) noexcept
        -> bool;

private:
    void normalize() noexcept;

    std::uint64_t coefficient_{0};
    std::int32_t exponent_{0};
    bool negative_{false};
    bool finite_{true};
    double approx_{0.0};
};

}  // namespace conform::value

#endif  // CONFORM_VALUE_DECIMAL_HPP
