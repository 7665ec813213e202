#ifndef SCUQ_UNIT_HPP
#define SCUQ_UNIT_HPP

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <source_location>
#include <string_view>

#include <scuq/Exception.hpp>
#include <scuq/Rational.hpp>

namespace scuq {

enum class Dimension : std::uint8_t { Length, Mass, Time, Current, Temperature, Amount, LuminousIntensity };

inline constexpr std::size_t kDimensionCount = 7UZ;

inline constexpr std::array<Dimension, kDimensionCount> kDimensions{Dimension::Length, Dimension::Mass, Dimension::Time, Dimension::Current, Dimension::Temperature, Dimension::Amount, Dimension::LuminousIntensity};

[[nodiscard]] constexpr std::string_view dimensionName(Dimension dimension) noexcept {
    constexpr std::array<std::string_view, kDimensionCount> names{"length", "mass", "time", "current", "temperature", "amount", "luminous intensity"};
    return names[static_cast<std::size_t>(dimension)];
}

/// symbol of the coherent SI base unit of a dimension ("kg" for mass)
[[nodiscard]] constexpr std::string_view baseUnitSymbol(Dimension dimension) noexcept {
    constexpr std::array<std::string_view, kDimensionCount> symbols{"m", "kg", "s", "A", "K", "mol", "cd"};
    return symbols[static_cast<std::size_t>(dimension)];
}

using Exponents = std::array<Rational, kDimensionCount>;

/**
 * @brief physical unit: rational exponents over the seven SI base dimensions and a scale relative to the coherent SI unit
 *
 * e.g. km/h = {length: 1, time: -1} with scale 1000/3600. Two units are additively compatible iff their exponents match;
 * their scales then only define a conversion factor. Equality (and hashing) requires exponents and scale to match exactly.
 * The scale is always finite and strictly positive.
 */
class Unit {
    Exponents _exponents{};
    double    _scale = 1.0;

    [[nodiscard]] static constexpr bool isValidScale(double scale) noexcept { return scale > 0.0 && scale <= std::numeric_limits<double>::max(); }

    template<typename Fn>
    [[nodiscard]] constexpr Exponents zipExponents(const Unit& other, Fn&& fn) const {
        Exponents result{};
        std::ranges::transform(_exponents, other._exponents, result.begin(), fn);
        return result;
    }

public:
    /// dimensionless unit 'one'
    constexpr Unit() noexcept = default;

    constexpr Unit(const Exponents& exponents, double scale = 1.0, std::source_location location = std::source_location::current()) : _exponents(exponents), _scale(scale) {
        if (!isValidScale(scale)) [[unlikely]] {
            throw DomainError("unit scale must be finite and > 0", location);
        }
    }

    [[nodiscard]] static constexpr Unit dimensionless() noexcept { return Unit{}; }

    [[nodiscard]] static constexpr Unit base(Dimension dimension) noexcept {
        Unit unit;
        unit._exponents[static_cast<std::size_t>(dimension)] = Rational{1};
        return unit;
    }

    [[nodiscard]] constexpr const Exponents& exponents() const noexcept { return _exponents; }
    [[nodiscard]] constexpr Rational         exponent(Dimension dimension) const noexcept { return _exponents[static_cast<std::size_t>(dimension)]; }
    [[nodiscard]] constexpr double           scale() const noexcept { return _scale; }

    [[nodiscard]] constexpr bool isDimensionless() const noexcept {
        return std::ranges::all_of(_exponents, [](const Rational& exponent) { return exponent.isZero(); });
    }

    /// true if the scale is exactly 1, i.e. a coherent SI unit such as m, N, or m^(1/2)
    [[nodiscard]] constexpr bool isCoherent() const noexcept { return _scale == 1.0; }

    /// same dimension, scale 1
    [[nodiscard]] constexpr Unit coherent() const noexcept {
        Unit unit;
        unit._exponents = _exponents;
        return unit;
    }

    [[nodiscard]] constexpr bool isCompatibleWith(const Unit& other) const noexcept { return _exponents == other._exponents; }

    /// factor f such that x [this] == x * f [target]; throws IncompatibleUnitsError if the dimensions differ
    [[nodiscard]] double conversionFactorTo(const Unit& target, std::source_location location = std::source_location::current()) const;

    [[nodiscard]] constexpr Unit multiply(const Unit& other, std::source_location location = std::source_location::current()) const {
        return {zipExponents(other, [](const Rational& a, const Rational& b) { return a + b; }), _scale * other._scale, location};
    }

    [[nodiscard]] constexpr Unit divide(const Unit& other, std::source_location location = std::source_location::current()) const {
        return {zipExponents(other, [](const Rational& a, const Rational& b) { return a - b; }), _scale / other._scale, location};
    }

    [[nodiscard]] constexpr Unit inverse(std::source_location location = std::source_location::current()) const { return dimensionless().divide(*this, location); }

    /// exponents multiplied by n, scale raised to n (e.g. sqrt(m) = m^(1/2))
    [[nodiscard]] Unit power(const Rational& exponent, std::source_location location = std::source_location::current()) const;

    template<std::integral I>
    [[nodiscard]] Unit power(I exponent, std::source_location location = std::source_location::current()) const {
        return power(Rational{static_cast<std::int64_t>(exponent)}, location);
    }

    /**
     * @brief power with a floating-point exponent
     *
     * The exponent is recovered as an exact fraction with denominator <= Rational::defaultMaxDenominator (0.5 -> 1/2);
     * if none exists and the unit is not dimensionless a FractionalDimensionError is raised.
     */
    [[nodiscard]] Unit power(double exponent, std::source_location location = std::source_location::current()) const;

    /// n-th root, n != 0
    [[nodiscard]] Unit root(std::int64_t n, std::source_location location = std::source_location::current()) const { return power(Rational{1, n, location}, location); }

    /// this unit multiplied by a prefix or conversion factor, e.g. metre.scaled(1e3) == kilometre
    [[nodiscard]] constexpr Unit scaled(double factor, std::source_location location = std::source_location::current()) const { return {_exponents, _scale * factor, location}; }

    friend constexpr Unit operator*(const Unit& lhs, const Unit& rhs) { return lhs.multiply(rhs); }
    friend constexpr Unit operator/(const Unit& lhs, const Unit& rhs) { return lhs.divide(rhs); }
    friend constexpr Unit operator*(double factor, const Unit& unit) { return unit.scaled(factor); }
    friend constexpr Unit operator*(const Unit& unit, double factor) { return unit.scaled(factor); }
    friend constexpr Unit operator/(const Unit& unit, double factor) { return unit.scaled(1.0 / factor); }

    friend constexpr bool operator==(const Unit& lhs, const Unit& rhs) noexcept = default;
};

} // namespace scuq

template<>
struct std::hash<scuq::Unit> {
    std::size_t operator()(const scuq::Unit& unit) const noexcept {
        std::size_t seed = std::hash<double>{}(unit.scale());
        for (const auto& exponent : unit.exponents()) {
            seed ^= std::hash<std::int64_t>{}(exponent.numerator()) + 0x9e3779b97f4a7c15UZ + (seed << 6) + (seed >> 2);
            seed ^= std::hash<std::int64_t>{}(exponent.denominator()) + 0x9e3779b97f4a7c15UZ + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

#endif // SCUQ_UNIT_HPP
