#ifndef SCUQ_RATIONAL_HPP
#define SCUQ_RATIONAL_HPP

#include <algorithm>
#include <cmath>
#include <compare>
#include <concepts>
#include <cstdint>
#include <limits>
#include <numeric>
#include <optional>
#include <source_location>
#include <utility>

#include <scuq/Exception.hpp>

namespace scuq {

/**
 * @brief exact fraction used for unit exponents (e.g. m^(1/2) after a square root)
 *
 * Always kept normalised: positive denominator, numerator and denominator coprime.
 * Numerator and denominator never hold INT64_MIN, so negation cannot overflow.
 * Arithmetic that would overflow 64-bit integers throws FractionalDimensionError instead of silently wrapping.
 */
class Rational {
    std::int64_t _num = 0;
    std::int64_t _den = 1;

    static constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
    static constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

    [[nodiscard]] static constexpr bool mulOverflows(std::int64_t a, std::int64_t b) noexcept {
        if (a > 0) {
            return b > 0 ? a > kMax / b : b < kMin / a;
        }
        return b > 0 ? a < kMin / b : (a != 0 && b < kMax / a);
    }

    [[nodiscard]] static constexpr bool addOverflows(std::int64_t a, std::int64_t b) noexcept { return (b > 0 && a > kMax - b) || (b < 0 && a < kMin - b); }

    [[nodiscard]] static constexpr std::int64_t checkedMul(std::int64_t a, std::int64_t b, std::source_location location) {
        if (mulOverflows(a, b)) [[unlikely]] {
            throw FractionalDimensionError("rational exponent overflow in multiplication", location);
        }
        return a * b;
    }

    [[nodiscard]] static constexpr std::int64_t checkedAdd(std::int64_t a, std::int64_t b, std::source_location location) {
        if (addOverflows(a, b)) [[unlikely]] {
            throw FractionalDimensionError("rational exponent overflow in addition", location);
        }
        return a + b;
    }

    // a/b <=> c/d for b, d > 0, comparing floor quotients and then the reciprocal remainders (Euclid) without overflow
    [[nodiscard]] static constexpr std::strong_ordering compareFractions(std::int64_t a, std::int64_t b, std::int64_t c, std::int64_t d) noexcept {
        while (true) {
            const std::int64_t r1 = a % b < 0 ? a % b + b : a % b;
            const std::int64_t r2 = c % d < 0 ? c % d + d : c % d;
            const std::int64_t q1 = a / b - (a % b < 0 ? 1 : 0);
            const std::int64_t q2 = c / d - (c % d < 0 ? 1 : 0);
            if (q1 != q2) {
                return q1 <=> q2;
            }
            if (r1 == 0 || r2 == 0) {
                return r1 <=> r2;
            }
            // r1/b <=> r2/d is the reverse of b/r1 <=> d/r2
            const std::int64_t oldB = b;
            a                       = d;
            b                       = r2;
            c                       = oldB;
            d                       = r1;
        }
    }

public:
    static constexpr std::int64_t defaultMaxDenominator = 1000;

    constexpr Rational() noexcept = default;

    explicit(false) constexpr Rational(std::int64_t numerator, std::source_location location = std::source_location::current()) : _num(numerator) {
        if (numerator == kMin) [[unlikely]] {
            throw FractionalDimensionError("rational number out of range", location);
        }
    }

    constexpr Rational(std::int64_t numerator, std::int64_t denominator, std::source_location location = std::source_location::current()) {
        if (denominator == 0) [[unlikely]] {
            throw DivisionByZeroError("rational number with zero denominator", location);
        }
        if (numerator == kMin || denominator == kMin) [[unlikely]] {
            throw FractionalDimensionError("rational number out of range", location);
        }
        if (denominator < 0) {
            numerator   = -numerator;
            denominator = -denominator;
        }
        const std::int64_t divisor = std::gcd(numerator, denominator);
        _num                       = numerator / divisor;
        _den                       = denominator / divisor;
    }

    [[nodiscard]] constexpr std::int64_t numerator() const noexcept { return _num; }
    [[nodiscard]] constexpr std::int64_t denominator() const noexcept { return _den; }
    [[nodiscard]] constexpr bool         isInteger() const noexcept { return _den == 1; }
    [[nodiscard]] constexpr bool         isZero() const noexcept { return _num == 0; }

    template<std::floating_point T = double>
    [[nodiscard]] constexpr T toFloatingPoint() const noexcept {
        return static_cast<T>(_num) / static_cast<T>(_den);
    }

    [[nodiscard]] constexpr Rational inverse(std::source_location location = std::source_location::current()) const { return {_den, _num, location}; }

    [[nodiscard]] constexpr Rational operator-() const noexcept { return fromNormalised(-_num, _den); }

    [[nodiscard]] constexpr Rational add(const Rational& other, std::source_location location = std::source_location::current()) const {
        const std::int64_t divisor = std::gcd(_den, other._den);
        const std::int64_t lhsMul  = other._den / divisor;
        const std::int64_t rhsMul  = _den / divisor;
        return {checkedAdd(checkedMul(_num, lhsMul, location), checkedMul(other._num, rhsMul, location), location), checkedMul(_den, lhsMul, location), location};
    }

    [[nodiscard]] constexpr Rational multiply(const Rational& other, std::source_location location = std::source_location::current()) const {
        // cross-reduce first to keep intermediate values small
        const std::int64_t g1 = std::gcd(_num, other._den); // >= 1 since denominators are positive
        const std::int64_t g2 = std::gcd(other._num, _den);
        return {checkedMul(_num / g1, other._num / g2, location), checkedMul(_den / g2, other._den / g1, location), location};
    }

    [[nodiscard]] constexpr Rational divide(const Rational& other, std::source_location location = std::source_location::current()) const { return multiply(other.inverse(location), location); }

    friend constexpr Rational operator+(const Rational& lhs, const Rational& rhs) { return lhs.add(rhs); }
    friend constexpr Rational operator-(const Rational& lhs, const Rational& rhs) { return lhs.add(-rhs); }
    friend constexpr Rational operator*(const Rational& lhs, const Rational& rhs) { return lhs.multiply(rhs); }
    friend constexpr Rational operator/(const Rational& lhs, const Rational& rhs) { return lhs.divide(rhs); }

    constexpr Rational& operator+=(const Rational& rhs) { return *this = *this + rhs; }
    constexpr Rational& operator-=(const Rational& rhs) { return *this = *this - rhs; }
    constexpr Rational& operator*=(const Rational& rhs) { return *this = *this * rhs; }
    constexpr Rational& operator/=(const Rational& rhs) { return *this = *this / rhs; }

    friend constexpr bool operator==(const Rational&, const Rational&) noexcept = default;

    friend constexpr std::strong_ordering operator<=>(const Rational& lhs, const Rational& rhs) noexcept {
        return compareFractions(lhs._num, lhs._den, rhs._num, rhs._den);
    }

    /**
     * @brief recovers the exact fraction behind a floating-point exponent (e.g. 0.5 -> 1/2, 1./3. -> 1/3)
     *
     * Uses the continued-fraction expansion of value and returns the first convergent that reproduces value to within
     * a few ulps, or std::nullopt if none exists with a denominator <= maxDenominator (e.g. for pi or sqrt(2)).
     */
    [[nodiscard]] static std::optional<Rational> fromDouble(double value, std::int64_t maxDenominator = defaultMaxDenominator) noexcept {
        if (!std::isfinite(value) || std::abs(value) >= 0x1p62) {
            return std::nullopt;
        }
        constexpr double tolerance = 16 * std::numeric_limits<double>::epsilon();

        std::int64_t hPrev = 0, h = 1; // numerators of the convergents
        std::int64_t kPrev = 1, k = 0; // denominators of the convergents
        double       remainder = value;
        for (int iteration = 0; iteration < 64; ++iteration) {
            const double       floorValue = std::floor(remainder);
            const std::int64_t term       = static_cast<std::int64_t>(floorValue);
            if (mulOverflows(term, h) || addOverflows(term * h, hPrev) || mulOverflows(term, k) || addOverflows(term * k, kPrev)) {
                return std::nullopt;
            }
            const std::int64_t hNext = term * h + hPrev;
            const std::int64_t kNext = term * k + kPrev;
            if (kNext > maxDenominator) {
                return std::nullopt;
            }
            hPrev = std::exchange(h, hNext);
            kPrev = std::exchange(k, kNext);

            const double approximation = static_cast<double>(h) / static_cast<double>(k);
            if (std::abs(value - approximation) <= tolerance * std::max(1.0, std::abs(value))) {
                return Rational{h, k};
            }
            const double fraction = remainder - floorValue;
            if (fraction == 0.0) {
                return std::nullopt;
            }
            remainder = 1.0 / fraction;
        }
        return std::nullopt;
    }

private:
    [[nodiscard]] static constexpr Rational fromNormalised(std::int64_t numerator, std::int64_t denominator) noexcept {
        Rational result;
        result._num = numerator;
        result._den = denominator;
        return result;
    }
};

static_assert(Rational{2, 4} == Rational{1, 2});
static_assert(Rational{-3, -6} == Rational{1, 2});
static_assert(Rational{1, 2} + Rational{1, 3} == Rational{5, 6});
static_assert(Rational{2, 3} * Rational{3, 4} == Rational{1, 2});
static_assert(Rational{1, 3} < Rational{1, 2});
static_assert(Rational{-1, 3} > Rational{-1, 2});
static_assert(Rational{7, 3} > Rational{9, 4});

} // namespace scuq

#endif // SCUQ_RATIONAL_HPP
