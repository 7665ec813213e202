#ifndef SCUQ_QUANTITY_HPP
#define SCUQ_QUANTITY_HPP

#include <cmath>
#include <compare>
#include <complex>
#include <concepts>
#include <source_location>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include <scuq/Context.hpp>
#include <scuq/Exception.hpp>
#include <scuq/Rational.hpp>
#include <scuq/UncertainValue.hpp>
#include <scuq/Unit.hpp>
#include <scuq/formatter/UnitFormatter.hpp>
#include <scuq/meta/utils.hpp>

namespace scuq {

/**
 * @brief uncertain value tagged with a physical unit
 *
 * Numeric propagation is delegated to UncertainValue, dimensional checks to Unit:
 *  - additive operations and comparisons require compatible units; the right-hand operand is converted into the
 *    unit of the left-hand operand, which is also the unit of the result,
 *  - multiplicative operations combine units and never fail dimensionally,
 *  - plain scalars and UncertainValues act as dimensionless quantities.
 *
 * Usage:
 * @code
 * const auto length = Quantity<double>::uncertain(10.0, 0.2, si::metre);
 * const auto time   = Quantity<double>::uncertain(2.0, 0.1, si::second);
 * const auto speed  = (length / time).convertTo(si::kilometre / si::hour);
 * @endcode
 */
template<meta::UncertaintyScalar T = double>
class Quantity {
public:
    using value_type     = T;
    using real_type      = meta::fundamental_base_value_type_t<T>;
    using uncertain_type = UncertainValue<T>;

private:
    UncertainValue<T> _value;
    Unit              _unit;

    void requireCompatible(const Unit& other, std::string_view operation, std::source_location location) const {
        if (!_unit.isCompatibleWith(other)) [[unlikely]] {
            throw IncompatibleUnitsError(fmt::format("{}: '{}' and '{}' differ in dimension", operation, _unit, other), location);
        }
    }

    /// value re-expressed in target (nominal and every sensitivity scaled by the conversion factor)
    [[nodiscard]] UncertainValue<T> valueIn(const Unit& target, std::source_location location) const {
        const double factor = _unit.conversionFactorTo(target, location);
        if (factor == 1.0) {
            return _value;
        }
        return _value.multiply(T(static_cast<real_type>(factor)));
    }

public:
    Quantity() = default;

    Quantity(UncertainValue<T> value, const Unit& unit) noexcept : _value(std::move(value)), _unit(unit) {}

    /// certain (exact) quantity
    Quantity(T nominal, const Unit& unit) noexcept : _value(nominal), _unit(unit) {}

    template<meta::UncertaintyScalar U>
    requires(!std::is_same_v<U, T> && std::is_convertible_v<U, T>)
    explicit(false) Quantity(const Quantity<U>& other) : _value(other.value()), _unit(other.unit()) {}

    /// nominal ± standardUncertainty [unit], backed by a fresh Component
    [[nodiscard]] static Quantity uncertain(T nominal, real_type standardUncertainty, const Unit& unit, std::source_location location = std::source_location::current())
    requires std::floating_point<T>
    {
        return {UncertainValue<T>::input(nominal, standardUncertainty, location), unit};
    }

    /// complex nominal with uncertain real and imaginary parts (correlation r between both parts)
    [[nodiscard]] static Quantity uncertain(T nominal, real_type uncertaintyReal, real_type uncertaintyImag, const Unit& unit, real_type correlation = real_type(0), std::source_location location = std::source_location::current())
    requires meta::complex_like<T>
    {
        return {UncertainValue<T>::input(nominal, uncertaintyReal, uncertaintyImag, correlation, location), unit};
    }

    [[nodiscard]] static Quantity fromVariance(T nominal, real_type variance, const Unit& unit, std::source_location location = std::source_location::current())
    requires std::floating_point<T>
    {
        return {UncertainValue<T>::fromVariance(nominal, variance, location), unit};
    }

    [[nodiscard]] const T&                 nominal() const noexcept { return _value.nominal(); }
    [[nodiscard]] const Unit&              unit() const noexcept { return _unit; }
    [[nodiscard]] const UncertainValue<T>& value() const noexcept { return _value; }
    [[nodiscard]] bool                     isCertain() const noexcept { return _value.isCertain(); }
    [[nodiscard]] real_type                variance() const { return _value.variance(); }
    [[nodiscard]] real_type                standardDeviation() const { return _value.standardDeviation(); }
    [[nodiscard]] real_type                relativeUncertainty(std::source_location location = std::source_location::current()) const { return _value.relativeUncertainty(location); }

    /// standard deviation as a certain quantity carrying this unit
    [[nodiscard]] Quantity<real_type> standardUncertainty() const { return {standardDeviation(), _unit}; }

    /// nominal value expressed in target
    [[nodiscard]] T nominalIn(const Unit& target, std::source_location location = std::source_location::current()) const { return nominal() * static_cast<real_type>(_unit.conversionFactorTo(target, location)); }

    [[nodiscard]] Quantity convertTo(const Unit& target, std::source_location location = std::source_location::current()) const { return {valueIn(target, location), target}; }

    /// same quantity in the coherent (scale 1) SI unit of its dimension, e.g. km/h -> m/s
    [[nodiscard]] Quantity inCoherentUnit() const { return convertTo(_unit.coherent()); }

    [[nodiscard]] Quantity negate() const { return {_value.negate(), _unit}; }

    [[nodiscard]] Quantity add(const Quantity& other, std::source_location location = std::source_location::current()) const {
        requireCompatible(other._unit, "addition", location);
        return {_value.add(other.valueIn(_unit, location)), _unit};
    }

    [[nodiscard]] Quantity subtract(const Quantity& other, std::source_location location = std::source_location::current()) const {
        requireCompatible(other._unit, "subtraction", location);
        return {_value.subtract(other.valueIn(_unit, location)), _unit};
    }

    [[nodiscard]] Quantity multiply(const Quantity& other, std::source_location location = std::source_location::current()) const { return {_value.multiply(other._value), _unit.multiply(other._unit, location)}; }

    [[nodiscard]] Quantity divide(const Quantity& other, std::source_location location = std::source_location::current()) const { return {_value.divide(other._value, location), _unit.divide(other._unit, location)}; }

    [[nodiscard]] Quantity multiply(const T& constant) const { return {_value.multiply(constant), _unit}; }

    [[nodiscard]] Quantity divide(const T& constant, std::source_location location = std::source_location::current()) const { return {_value.divide(constant, location), _unit}; }

    [[nodiscard]] Quantity power(const Rational& exponent, std::source_location location = std::source_location::current()) const { return {_value.power(exponent, location), _unit.power(exponent, location)}; }

    template<std::integral I>
    [[nodiscard]] Quantity power(I exponent, std::source_location location = std::source_location::current()) const {
        return power(Rational{static_cast<std::int64_t>(exponent)}, location);
    }

    /// the unit exponent must have an exact rational representation (0.5 -> 1/2) unless the unit is dimensionless
    [[nodiscard]] Quantity power(real_type exponent, std::source_location location = std::source_location::current()) const {
        const Unit unit = _unit.power(static_cast<double>(exponent), location);
        return {_value.power(exponent, location), unit};
    }

    [[nodiscard]] Quantity sqrt(std::source_location location = std::source_location::current()) const { return power(Rational{1, 2}, location); }

    /// value in the coherent dimensionless unit; throws IncompatibleUnitsError for dimensioned quantities
    [[nodiscard]] UncertainValue<T> dimensionlessValue(std::string_view operation, std::source_location location = std::source_location::current()) const {
        if (!_unit.isDimensionless()) [[unlikely]] {
            throw IncompatibleUnitsError(fmt::format("{} requires a dimensionless argument, got '{}'", operation, _unit), location);
        }
        return valueIn(Unit::dimensionless(), location);
    }

    /// covariance in the product unit of both operands
    [[nodiscard]] Quantity covariance(const Quantity& other, std::source_location location = std::source_location::current()) const { return {_value.covariance(other._value), _unit.multiply(other._unit, location)}; }

    [[nodiscard]] T correlation(const Quantity& other) const { return _value.correlation(other._value); }

    /**
     * @brief uncertainty-aware equality: |a - b| <= k * sigma(a - b)
     *
     * sigma(a - b) accounts for the covariance of both operands, e.g. x.isConsistentWith(x) holds for any k >= 0.
     */
    [[nodiscard]] bool isConsistentWith(const Quantity& other, double coverageFactor = 2.0, std::source_location location = std::source_location::current()) const {
        if (!std::isfinite(coverageFactor) || coverageFactor < 0.0) [[unlikely]] {
            throw InvalidUncertaintyError("coverage factor must be finite and >= 0", location);
        }
        const Quantity difference = subtract(other, location);
        return std::abs(difference.nominal()) <= static_cast<real_type>(coverageFactor) * difference.standardDeviation();
    }

    friend Quantity operator+(const Quantity& q) { return q; }
    friend Quantity operator-(const Quantity& q) { return q.negate(); }

    friend Quantity operator+(const Quantity& lhs, const Quantity& rhs) { return lhs.add(rhs); }
    friend Quantity operator+(const Quantity& lhs, const T& rhs) { return lhs.add(Quantity{rhs, Unit{}}); }
    friend Quantity operator+(const T& lhs, const Quantity& rhs) { return Quantity{lhs, Unit{}}.add(rhs); }
    friend Quantity operator+(const Quantity& lhs, const UncertainValue<T>& rhs) { return lhs.add(Quantity{rhs, Unit{}}); }
    friend Quantity operator+(const UncertainValue<T>& lhs, const Quantity& rhs) { return Quantity{lhs, Unit{}}.add(rhs); }

    friend Quantity operator-(const Quantity& lhs, const Quantity& rhs) { return lhs.subtract(rhs); }
    friend Quantity operator-(const Quantity& lhs, const T& rhs) { return lhs.subtract(Quantity{rhs, Unit{}}); }
    friend Quantity operator-(const T& lhs, const Quantity& rhs) { return Quantity{lhs, Unit{}}.subtract(rhs); }
    friend Quantity operator-(const Quantity& lhs, const UncertainValue<T>& rhs) { return lhs.subtract(Quantity{rhs, Unit{}}); }
    friend Quantity operator-(const UncertainValue<T>& lhs, const Quantity& rhs) { return Quantity{lhs, Unit{}}.subtract(rhs); }

    friend Quantity operator*(const Quantity& lhs, const Quantity& rhs) { return lhs.multiply(rhs); }
    friend Quantity operator*(const Quantity& lhs, const T& rhs) { return lhs.multiply(rhs); }
    friend Quantity operator*(const T& lhs, const Quantity& rhs) { return rhs.multiply(lhs); }
    friend Quantity operator*(const Quantity& lhs, const UncertainValue<T>& rhs) { return {lhs._value.multiply(rhs), lhs._unit}; }
    friend Quantity operator*(const UncertainValue<T>& lhs, const Quantity& rhs) { return {lhs.multiply(rhs._value), rhs._unit}; }

    friend Quantity operator/(const Quantity& lhs, const Quantity& rhs) { return lhs.divide(rhs); }
    friend Quantity operator/(const Quantity& lhs, const T& rhs) { return lhs.divide(rhs); }
    friend Quantity operator/(const T& lhs, const Quantity& rhs) { return Quantity{lhs, Unit{}}.divide(rhs); }
    friend Quantity operator/(const Quantity& lhs, const UncertainValue<T>& rhs) { return {lhs._value.divide(rhs), lhs._unit}; }
    friend Quantity operator/(const UncertainValue<T>& lhs, const Quantity& rhs) { return Quantity{lhs, Unit{}}.divide(rhs); }

    template<typename U>
    Quantity& operator+=(const U& rhs) {
        return *this = *this + rhs;
    }
    template<typename U>
    Quantity& operator-=(const U& rhs) {
        return *this = *this - rhs;
    }
    template<typename U>
    Quantity& operator*=(const U& rhs) {
        return *this = *this * rhs;
    }
    template<typename U>
    Quantity& operator/=(const U& rhs) {
        return *this = *this / rhs;
    }

    /// compares nominal values after conversion into the left-hand unit; the uncertainty does not take part
    friend bool operator==(const Quantity& lhs, const Quantity& rhs) {
        lhs.requireCompatible(rhs._unit, "comparison", std::source_location::current());
        return lhs.nominal() == rhs.nominalIn(lhs._unit);
    }

    friend std::partial_ordering operator<=>(const Quantity& lhs, const Quantity& rhs)
    requires std::floating_point<T>
    {
        lhs.requireCompatible(rhs._unit, "comparison", std::source_location::current());
        return lhs.nominal() <=> rhs.nominalIn(lhs._unit);
    }
};

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> covariance(const Quantity<T>& lhs, const Quantity<T>& rhs) {
    return lhs.covariance(rhs);
}

template<meta::UncertaintyScalar T>
Quantity<meta::fundamental_base_value_type_t<T>> Context::uncertainty(const Quantity<T>& q) const {
    return {standardUncertainty(q.value()), q.unit()};
}

template<meta::UncertaintyScalar T>
T Context::covariance(const Quantity<T>& x, const Quantity<T>& y) const {
    return covariance(x.value(), y.value());
}

} // namespace scuq

namespace scuq::math {

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> sqrt(const Quantity<T>& q, std::source_location location = std::source_location::current()) {
    return q.sqrt(location);
}

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> pow(const Quantity<T>& q, std::integral auto exponent, std::source_location location = std::source_location::current()) {
    return q.power(exponent, location);
}

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> pow(const Quantity<T>& q, const Rational& exponent, std::source_location location = std::source_location::current()) {
    return q.power(exponent, location);
}

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> pow(const Quantity<T>& q, std::floating_point auto exponent, std::source_location location = std::source_location::current()) {
    return q.power(static_cast<meta::fundamental_base_value_type_t<T>>(exponent), location);
}

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> exp(const Quantity<T>& q, std::source_location location = std::source_location::current()) {
    return {exp(q.dimensionlessValue("exp", location)), Unit{}};
}

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> log(const Quantity<T>& q, std::source_location location = std::source_location::current()) {
    return {log(q.dimensionlessValue("log", location), location), Unit{}};
}

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> log10(const Quantity<T>& q, std::source_location location = std::source_location::current()) {
    return {log10(q.dimensionlessValue("log10", location), location), Unit{}};
}

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> sin(const Quantity<T>& q, std::source_location location = std::source_location::current()) {
    return {sin(q.dimensionlessValue("sin", location)), Unit{}};
}

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> cos(const Quantity<T>& q, std::source_location location = std::source_location::current()) {
    return {cos(q.dimensionlessValue("cos", location)), Unit{}};
}

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> tan(const Quantity<T>& q, std::source_location location = std::source_location::current()) {
    return {tan(q.dimensionlessValue("tan", location), location), Unit{}};
}

template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<T> atan(const Quantity<T>& q, std::source_location location = std::source_location::current()) {
    return {atan(q.dimensionlessValue("atan", location), location), Unit{}};
}

/// angle of (x, y) in radian; both coordinates must share a dimension
template<std::floating_point T>
[[nodiscard]] Quantity<T> atan2(const Quantity<T>& y, const Quantity<T>& x, std::source_location location = std::source_location::current()) {
    const Quantity<T> yInX = y.convertTo(x.unit(), location);
    return {atan2(yInX.value(), x.value(), location), Unit{}};
}

template<std::floating_point T>
[[nodiscard]] Quantity<T> abs(const Quantity<T>& q) {
    return {abs(q.value()), q.unit()};
}

/// |z| in the unit of z
template<meta::UncertaintyScalar T>
[[nodiscard]] Quantity<meta::fundamental_base_value_type_t<T>> magnitude(const Quantity<T>& q, std::source_location location = std::source_location::current()) {
    return {q.value().magnitude(location), q.unit()};
}

/// arg(z) in radian
template<meta::complex_like T>
[[nodiscard]] Quantity<meta::fundamental_base_value_type_t<T>> phase(const Quantity<T>& q, std::source_location location = std::source_location::current()) {
    return {q.value().phase(location), Unit{}};
}

template<meta::complex_like T>
[[nodiscard]] Quantity<meta::fundamental_base_value_type_t<T>> real(const Quantity<T>& q) {
    return {q.value().realPart(), q.unit()};
}

template<meta::complex_like T>
[[nodiscard]] Quantity<meta::fundamental_base_value_type_t<T>> imag(const Quantity<T>& q) {
    return {q.value().imagPart(), q.unit()};
}

template<meta::complex_like T>
[[nodiscard]] Quantity<T> conj(const Quantity<T>& q) {
    return {q.value().conj(), q.unit()};
}

} // namespace scuq::math

#endif // SCUQ_QUANTITY_HPP
