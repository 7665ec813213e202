#ifndef SCUQ_UNCERTAINVALUE_HPP
#define SCUQ_UNCERTAINVALUE_HPP

#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <concepts>
#include <cstdint>
#include <numbers>
#include <source_location>
#include <type_traits>
#include <utility>

#include <scuq/Component.hpp>
#include <scuq/Exception.hpp>
#include <scuq/Rational.hpp>
#include <scuq/SensitivityMap.hpp>
#include <scuq/meta/utils.hpp>

namespace scuq {

/**
 *
 * @brief Propagation of Uncertainties with correlation bookkeeping
 *
 * original idea by: Evan Manning, "Uncertainty Propagation in C++", NASA Jet Propulsion Laboratory,
 * C/C++ Users Journal Volume 14, Number 3, March, 1996
 * and B. D. Hall, "The 'GUM Tree': A software design pattern for handling measurement uncertainty",
 * Industrial Research Report 1291, Measurement Standards Laboratory New Zealand (2003).
 *
 * Each value carries its nominal value and the first-order sensitivities to every independent Component it
 * (transitively) depends on. Variances and covariances are evaluated from those sensitivities on demand, so values
 * that share an origin (e.g. x and 2*x) are correctly correlated and x - x is exactly certain.
 * Sums and scalar multiples are propagated exactly; products, quotients, powers and elementary functions are
 * linearised at the nominal value (standard GUM first-order propagation).
 *
 * For complex T the value is two correlated real parts over the same components, see SensitivityMap.
 */
template<meta::UncertaintyScalar T>
class UncertainValue {
public:
    using value_type = T;
    using real_type  = meta::fundamental_base_value_type_t<T>;
    using map_type   = SensitivityMap<T>;

private:
    T        _nominal = static_cast<T>(0);
    map_type _sensitivities;

    [[nodiscard]] UncertainValue chain(T newNominal, T derivative) const {
        if (isCertain()) {
            return UncertainValue{newNominal};
        }
        return UncertainValue{newNominal, _sensitivities.scale(derivative)};
    }

    [[nodiscard]] static bool isZero(const T& x) noexcept { return x == static_cast<T>(0); }

public:
    UncertainValue() = default;

    /// certain (exact) value
    explicit(false) UncertainValue(T nominal) noexcept : _nominal(nominal) {}

    UncertainValue(T nominal, map_type sensitivities) noexcept : _nominal(nominal), _sensitivities(std::move(sensitivities)) {}

    /// real -> complex and float -> double promotion
    template<meta::UncertaintyScalar U>
    requires(!std::is_same_v<U, T> && std::is_convertible_v<U, T>)
    explicit(false) UncertainValue(const UncertainValue<U>& other) : _nominal(static_cast<T>(other.nominal())), _sensitivities(other.sensitivities()) {}

    /// new independent input nominal ± standardUncertainty, allocates a fresh Component
    [[nodiscard]] static UncertainValue input(T nominal, real_type standardUncertainty, std::source_location location = std::source_location::current())
    requires std::floating_point<T>
    {
        return UncertainValue{nominal, map_type::fromComponent(ComponentRegistry::fromStandardUncertainty(static_cast<double>(standardUncertainty), location))};
    }

    /// new independent input nominal with the given variance, allocates a fresh Component
    [[nodiscard]] static UncertainValue fromVariance(T nominal, real_type variance, std::source_location location = std::source_location::current())
    requires std::floating_point<T>
    {
        return UncertainValue{nominal, map_type::fromComponent(ComponentRegistry::newComponent(static_cast<double>(variance), location))};
    }

    /**
     * @brief new complex input with standard uncertainties of the real and imaginary parts and their correlation
     *
     * Allocates two Components e1 (variance uRe^2) and e2 (variance uIm^2 (1 - r^2)) with Re = e1 and
     * Im = r uIm/uRe e1 + e2, which reproduces var(Re), var(Im) and cov(Re, Im) = r uRe uIm.
     * With uRe == 0 the real part is certain, r has no effect and e2 carries the full uIm^2.
     */
    [[nodiscard]] static UncertainValue input(T nominal, real_type uncertaintyReal, real_type uncertaintyImag, real_type correlation = real_type(0), std::source_location location = std::source_location::current())
    requires meta::complex_like<T>
    {
        if (!std::isfinite(uncertaintyReal) || uncertaintyReal < real_type(0) || !std::isfinite(uncertaintyImag) || uncertaintyImag < real_type(0)) [[unlikely]] {
            throw InvalidUncertaintyError("standard uncertainties of real and imaginary part must be finite and non-negative", location);
        }
        if (!std::isfinite(correlation) || correlation < real_type(-1) || correlation > real_type(1)) [[unlikely]] {
            throw InvalidUncertaintyError("correlation between real and imaginary part must be within [-1, 1]", location);
        }
        const bool      realIsUncertain = uncertaintyReal > real_type(0);
        const double    imagResidual    = realIsUncertain ? static_cast<double>(uncertaintyImag) * std::sqrt(1.0 - static_cast<double>(correlation * correlation)) : static_cast<double>(uncertaintyImag);
        const Component realComponent   = ComponentRegistry::fromStandardUncertainty(static_cast<double>(uncertaintyReal), location);
        const Component imagComponent   = ComponentRegistry::fromStandardUncertainty(imagResidual, location);
        const real_type crossTerm       = realIsUncertain ? correlation * uncertaintyImag / uncertaintyReal : real_type(0);
        return UncertainValue{nominal, map_type::fromTerms({{realComponent, T{real_type(1), crossTerm}}, {imagComponent, T{real_type(0), real_type(1)}}})};
    }

    /// value depending linearly on an existing Component, e.g. to reuse one error source in several inputs
    [[nodiscard]] static UncertainValue fromComponent(T nominal, const Component& component, T coefficient = T{1}) { return UncertainValue{nominal, map_type::fromComponent(component, coefficient)}; }

    [[nodiscard]] const T&        nominal() const noexcept { return _nominal; }
    [[nodiscard]] const map_type& sensitivities() const noexcept { return _sensitivities; }

    /// true if no component with non-zero variance contributes
    [[nodiscard]] bool isCertain() const noexcept {
        return std::ranges::all_of(_sensitivities, [](const auto& term) { return term.component.variance() == 0.0; });
    }

    [[nodiscard]] real_type variance() const { return _sensitivities.variance(); }
    [[nodiscard]] real_type standardDeviation() const { return std::sqrt(variance()); }

    /// Hermitian covariance sum_c a_c conj(b_c) var(c); zero if both values share no component
    [[nodiscard]] T covariance(const UncertainValue& other) const { return _sensitivities.covariance(other._sensitivities); }

    /// covariance normalised by both standard deviations, zero if either value is certain
    [[nodiscard]] T correlation(const UncertainValue& other) const {
        const real_type norm = standardDeviation() * other.standardDeviation();
        return norm > real_type(0) ? covariance(other) / norm : T{0};
    }

    /// 2x2 real covariance of (Re, Im), see SensitivityMap::covarianceMatrix
    [[nodiscard]] std::array<std::array<real_type, 2UZ>, 2UZ> covarianceMatrix(const UncertainValue& other) const { return _sensitivities.covarianceMatrix(other._sensitivities); }
    [[nodiscard]] std::array<std::array<real_type, 2UZ>, 2UZ> covarianceMatrix() const { return covarianceMatrix(*this); }

    [[nodiscard]] real_type relativeUncertainty(std::source_location location = std::source_location::current()) const {
        if (isZero(_nominal)) [[unlikely]] {
            throw DivisionByZeroError("relative uncertainty of a zero nominal value", location);
        }
        return standardDeviation() / std::abs(_nominal);
    }

    // complex -> real projections

    [[nodiscard]] UncertainValue<real_type> realPart() const
    requires meta::complex_like<T>
    {
        return {_nominal.real(), _sensitivities.template transform<real_type>([](const T& c) { return c.real(); })};
    }

    [[nodiscard]] UncertainValue<real_type> imagPart() const
    requires meta::complex_like<T>
    {
        return {_nominal.imag(), _sensitivities.template transform<real_type>([](const T& c) { return c.imag(); })};
    }

    [[nodiscard]] UncertainValue conj() const
    requires meta::complex_like<T>
    {
        return {std::conj(_nominal), _sensitivities.transform([](const T& c) { return std::conj(c); })};
    }

    /// |z|, d|z| = Re(conj(z) dz) / |z|; for real values |x| with derivative sign(x)
    [[nodiscard]] UncertainValue<real_type> magnitude(std::source_location location = std::source_location::current()) const {
        const real_type absValue = std::abs(_nominal);
        if (isCertain()) {
            return UncertainValue<real_type>{absValue};
        }
        if (absValue == real_type(0)) [[unlikely]] {
            throw DomainError("magnitude is not differentiable at zero", location);
        }
        if constexpr (meta::complex_like<T>) {
            const T zConj = std::conj(_nominal);
            return {absValue, _sensitivities.template transform<real_type>([&](const T& c) { return (zConj * c).real() / absValue; })};
        } else {
            return {absValue, _sensitivities.scale(_nominal > T(0) ? T(1) : T(-1))};
        }
    }

    /// arg(z), d arg(z) = Im(conj(z) dz) / |z|^2
    [[nodiscard]] UncertainValue<real_type> phase(std::source_location location = std::source_location::current()) const
    requires meta::complex_like<T>
    {
        const real_type norm = std::norm(_nominal);
        if (isCertain()) {
            return UncertainValue<real_type>{std::arg(_nominal)};
        }
        if (norm == real_type(0)) [[unlikely]] {
            throw DomainError("phase is undefined at zero", location);
        }
        const T zConj = std::conj(_nominal);
        return {std::arg(_nominal), _sensitivities.template transform<real_type>([&](const T& c) { return (zConj * c).imag() / norm; })};
    }

    // arithmetic

    [[nodiscard]] UncertainValue negate() const { return {-_nominal, _sensitivities.scale(T(-1))}; }

    [[nodiscard]] UncertainValue add(const UncertainValue& other) const { return {_nominal + other._nominal, _sensitivities.add(other._sensitivities)}; }

    [[nodiscard]] UncertainValue subtract(const UncertainValue& other) const { return {_nominal - other._nominal, _sensitivities.combine(T(1), other._sensitivities, T(-1))}; }

    /// product rule: d(ab) = b da + a db
    [[nodiscard]] UncertainValue multiply(const UncertainValue& other) const { return {_nominal * other._nominal, _sensitivities.combine(other._nominal, other._sensitivities, _nominal)}; }

    /// exact scaling by a certain constant
    [[nodiscard]] UncertainValue multiply(const T& constant) const { return {_nominal * constant, _sensitivities.scale(constant)}; }

    /// quotient rule: d(a/b) = da / b - a db / b^2
    [[nodiscard]] UncertainValue divide(const UncertainValue& other, std::source_location location = std::source_location::current()) const {
        if (isZero(other._nominal)) [[unlikely]] {
            throw DivisionByZeroError("division by an uncertain value with zero nominal", location);
        }
        const T inverse = T(1) / other._nominal;
        return {_nominal * inverse, _sensitivities.combine(inverse, other._sensitivities, -_nominal * inverse * inverse)};
    }

    [[nodiscard]] UncertainValue divide(const T& constant, std::source_location location = std::source_location::current()) const {
        if (isZero(constant)) [[unlikely]] {
            throw DivisionByZeroError("division by zero constant", location);
        }
        return multiply(T(1) / constant);
    }

    /// constant / this
    [[nodiscard]] UncertainValue divideInto(const T& constant, std::source_location location = std::source_location::current()) const {
        if (isZero(_nominal)) [[unlikely]] {
            throw DivisionByZeroError("division by an uncertain value with zero nominal", location);
        }
        const T inverse = T(1) / _nominal;
        return {constant * inverse, _sensitivities.scale(-constant * inverse * inverse)};
    }

    /// x^n, d(x^n) = n x^(n-1) dx
    template<std::integral I>
    [[nodiscard]] UncertainValue power(I exponent, std::source_location location = std::source_location::current()) const {
        if (exponent == 0) {
            return UncertainValue{T(1)};
        }
        if (isZero(_nominal) && exponent < 0) [[unlikely]] {
            throw DivisionByZeroError("negative power of zero", location);
        }
        const auto n          = static_cast<real_type>(exponent);
        const T    derivative = exponent == 1 ? T(1) : n * std::pow(_nominal, n - real_type(1));
        return chain(std::pow(_nominal, n), derivative);
    }

    /**
     * @brief x^(p/q)
     *
     * Real values: odd-denominator roots of negative numbers are real (e.g. (-8)^(1/3) = -2); even-denominator
     * roots of negative numbers throw DomainError. Complex values use the principal branch.
     * At zero, exponents in (0, 1) have an infinite derivative (DomainError) and negative exponents divide by zero.
     */
    [[nodiscard]] UncertainValue power(const Rational& exponent, std::source_location location = std::source_location::current()) const {
        if (exponent.isInteger()) {
            return power(exponent.numerator(), location);
        }
        const auto p = exponent.toFloatingPoint<real_type>();
        if (isZero(_nominal)) {
            return powerAtZero(p, location);
        }
        T value{};
        if constexpr (meta::complex_like<T>) {
            value = std::pow(_nominal, p);
        } else if (_nominal < T(0)) {
            if (exponent.denominator() % 2 == 0) [[unlikely]] {
                throw DomainError("even root of a negative real value", location);
            }
            const T magnitudePower = std::pow(-_nominal, p);
            value                  = (exponent.numerator() % 2 == 0) ? magnitudePower : -magnitudePower;
        } else {
            value = std::pow(_nominal, p);
        }
        return chain(value, p * value / _nominal);
    }

    /// x^p for a real exponent p; non-integer p on a negative real value throws DomainError
    [[nodiscard]] UncertainValue power(real_type exponent, std::source_location location = std::source_location::current()) const {
        if (!std::isfinite(exponent)) [[unlikely]] {
            throw DomainError("non-finite exponent", location);
        }
        if (exponent == std::trunc(exponent) && std::abs(exponent) < real_type(0x1p62)) {
            return power(static_cast<std::int64_t>(exponent), location);
        }
        if (isZero(_nominal)) {
            return powerAtZero(exponent, location);
        }
        if constexpr (!meta::complex_like<T>) {
            if (_nominal < T(0)) [[unlikely]] {
                throw DomainError("non-integer power of a negative real value", location);
            }
        }
        const T value = std::pow(_nominal, exponent);
        return chain(value, exponent * value / _nominal);
    }

    /// x^y with uncertain exponent: d(x^y) = y x^(y-1) dx + x^y ln(x) dy
    [[nodiscard]] UncertainValue power(const UncertainValue& exponent, std::source_location location = std::source_location::current()) const {
        if (exponent.isCertain()) {
            if constexpr (meta::complex_like<T>) {
                if (exponent._nominal.imag() == real_type(0)) {
                    return power(exponent._nominal.real(), location);
                }
            } else {
                return power(exponent._nominal, location);
            }
        }
        if constexpr (meta::complex_like<T>) {
            if (isZero(_nominal)) [[unlikely]] {
                throw DomainError("uncertain exponent of a zero base (log undefined)", location);
            }
        } else {
            if (_nominal <= T(0)) [[unlikely]] {
                throw DomainError("uncertain exponent requires a positive real base", location);
            }
        }
        const T value = std::pow(_nominal, exponent._nominal);
        return {value, _sensitivities.combine(exponent._nominal * value / _nominal, exponent._sensitivities, value * std::log(_nominal))};
    }

    /// generic first-order chain rule: f(this) with f(nominal) = value and f'(nominal) = derivative
    [[nodiscard]] UncertainValue apply(T value, T derivative) const { return chain(value, derivative); }

    bool operator==(const UncertainValue&) const = default;

    // operators map one-to-one onto the named operations above

    friend UncertainValue operator+(const UncertainValue& val) { return val; }
    friend UncertainValue operator-(const UncertainValue& val) { return val.negate(); }

    friend UncertainValue operator+(const UncertainValue& lhs, const UncertainValue& rhs) { return lhs.add(rhs); }
    friend UncertainValue operator+(const UncertainValue& lhs, const T& rhs) { return {lhs._nominal + rhs, lhs._sensitivities}; }
    friend UncertainValue operator+(const T& lhs, const UncertainValue& rhs) { return {lhs + rhs._nominal, rhs._sensitivities}; }

    friend UncertainValue operator-(const UncertainValue& lhs, const UncertainValue& rhs) { return lhs.subtract(rhs); }
    friend UncertainValue operator-(const UncertainValue& lhs, const T& rhs) { return {lhs._nominal - rhs, lhs._sensitivities}; }
    friend UncertainValue operator-(const T& lhs, const UncertainValue& rhs) { return {lhs - rhs._nominal, rhs._sensitivities.scale(T(-1))}; }

    friend UncertainValue operator*(const UncertainValue& lhs, const UncertainValue& rhs) { return lhs.multiply(rhs); }
    friend UncertainValue operator*(const UncertainValue& lhs, const T& rhs) { return lhs.multiply(rhs); }
    friend UncertainValue operator*(const T& lhs, const UncertainValue& rhs) { return rhs.multiply(lhs); }

    friend UncertainValue operator/(const UncertainValue& lhs, const UncertainValue& rhs) { return lhs.divide(rhs); }
    friend UncertainValue operator/(const UncertainValue& lhs, const T& rhs) { return lhs.divide(rhs); }
    friend UncertainValue operator/(const T& lhs, const UncertainValue& rhs) { return rhs.divideInto(lhs); }

    template<typename U>
    UncertainValue& operator+=(const U& rhs) {
        return *this = *this + rhs;
    }
    template<typename U>
    UncertainValue& operator-=(const U& rhs) {
        return *this = *this - rhs;
    }
    template<typename U>
    UncertainValue& operator*=(const U& rhs) {
        return *this = *this * rhs;
    }
    template<typename U>
    UncertainValue& operator/=(const U& rhs) {
        return *this = *this / rhs;
    }

private:
    [[nodiscard]] UncertainValue powerAtZero(real_type exponent, std::source_location location) const {
        if (exponent < real_type(0)) [[unlikely]] {
            throw DivisionByZeroError("negative power of zero", location);
        }
        if (isCertain()) {
            return UncertainValue{T(0)};
        }
        if (exponent < real_type(1)) [[unlikely]] {
            throw DomainError("power with exponent < 1 has an infinite derivative at zero", location);
        }
        return UncertainValue{T(0), {}}; // derivative p * 0^(p-1) vanishes for p > 1
    }
};

template<typename T>
UncertainValue(T) -> UncertainValue<T>;

template<typename T>
concept UncertainValueLike = meta::is_instantiation_of<std::remove_cvref_t<T>, UncertainValue>;

template<typename T>
[[nodiscard]] constexpr auto nominal(const T& val) noexcept {
    if constexpr (UncertainValueLike<T>) {
        return val.nominal();
    } else {
        return val;
    }
}

template<typename T>
[[nodiscard]] auto standardDeviation(const T& val) {
    if constexpr (UncertainValueLike<T>) {
        return val.standardDeviation();
    } else {
        return meta::fundamental_base_value_type_t<T>(0);
    }
}

template<meta::UncertaintyScalar T>
[[nodiscard]] T covariance(const UncertainValue<T>& lhs, const UncertainValue<T>& rhs) {
    return lhs.covariance(rhs);
}

} // namespace scuq

namespace scuq::math {

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> pow(const UncertainValue<T>& base, std::integral auto exponent, std::source_location location = std::source_location::current()) {
    return base.power(static_cast<std::int64_t>(exponent), location);
}

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> pow(const UncertainValue<T>& base, const Rational& exponent, std::source_location location = std::source_location::current()) {
    return base.power(exponent, location);
}

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> pow(const UncertainValue<T>& base, std::floating_point auto exponent, std::source_location location = std::source_location::current()) {
    return base.power(static_cast<meta::fundamental_base_value_type_t<T>>(exponent), location);
}

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> pow(const UncertainValue<T>& base, const UncertainValue<T>& exponent, std::source_location location = std::source_location::current()) {
    return base.power(exponent, location);
}

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> sqrt(const UncertainValue<T>& x, std::source_location location = std::source_location::current()) {
    if constexpr (!meta::complex_like<T>) {
        if (x.nominal() < T(0)) [[unlikely]] {
            throw DomainError("square root of a negative real value", location);
        }
    }
    const T value = std::sqrt(x.nominal());
    if (x.isCertain()) {
        return UncertainValue<T>{value};
    }
    if (value == T(0)) [[unlikely]] {
        throw DomainError("square root has an infinite derivative at zero", location);
    }
    return x.apply(value, T(1) / (T(2) * value)); // d sqrt(x) = dx / (2 sqrt(x))
}

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> exp(const UncertainValue<T>& x) {
    const T value = std::exp(x.nominal());
    return x.apply(value, value);
}

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> log(const UncertainValue<T>& x, std::source_location location = std::source_location::current()) {
    if constexpr (meta::complex_like<T>) {
        if (x.nominal() == T(0)) [[unlikely]] {
            throw DomainError("logarithm of zero", location);
        }
    } else {
        if (x.nominal() <= T(0)) [[unlikely]] {
            throw DomainError("logarithm of a non-positive real value", location);
        }
    }
    return x.apply(std::log(x.nominal()), T(1) / x.nominal()); // d log(x) = dx / x
}

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> log10(const UncertainValue<T>& x, std::source_location location = std::source_location::current()) {
    using real_type     = meta::fundamental_base_value_type_t<T>;
    constexpr auto ln10 = std::numbers::ln10_v<real_type>;
    return log(x, location).multiply(T(real_type(1) / ln10));
}

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> sin(const UncertainValue<T>& x) {
    return x.apply(std::sin(x.nominal()), std::cos(x.nominal()));
}

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> cos(const UncertainValue<T>& x) {
    return x.apply(std::cos(x.nominal()), -std::sin(x.nominal()));
}

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> tan(const UncertainValue<T>& x, std::source_location location = std::source_location::current()) {
    const T cosValue = std::cos(x.nominal());
    if (cosValue == T(0)) [[unlikely]] {
        throw DomainError("tangent pole", location);
    }
    return x.apply(std::tan(x.nominal()), T(1) / (cosValue * cosValue)); // d tan(x) = dx / cos^2(x)
}

template<meta::UncertaintyScalar T>
[[nodiscard]] UncertainValue<T> atan(const UncertainValue<T>& x, std::source_location location = std::source_location::current()) {
    const T denominator = T(1) + x.nominal() * x.nominal();
    if (denominator == T(0)) [[unlikely]] {
        throw DomainError("arctangent branch point at +-i", location);
    }
    return x.apply(std::atan(x.nominal()), T(1) / denominator);
}

/// atan2(y, x) with d = (x dy - y dx) / (x^2 + y^2)
template<std::floating_point T>
[[nodiscard]] UncertainValue<T> atan2(const UncertainValue<T>& y, const UncertainValue<T>& x, std::source_location location = std::source_location::current()) {
    const T value = std::atan2(y.nominal(), x.nominal());
    if (y.isCertain() && x.isCertain()) {
        return UncertainValue<T>{value};
    }
    const T norm = x.nominal() * x.nominal() + y.nominal() * y.nominal();
    if (norm == T(0)) [[unlikely]] {
        throw DomainError("atan2 is not differentiable at the origin", location);
    }
    return {value, y.sensitivities().combine(x.nominal() / norm, x.sensitivities(), -y.nominal() / norm)};
}

template<std::floating_point T>
[[nodiscard]] UncertainValue<T> abs(const UncertainValue<T>& x) {
    return x.nominal() > T(0) ? x : -x;
}

template<typename T>
[[nodiscard]] constexpr bool isfinite(const T& value) noexcept {
    if constexpr (UncertainValueLike<T>) {
        using real_type = typename T::real_type;
        if constexpr (meta::complex_like<typename T::value_type>) {
            return std::isfinite(value.nominal().real()) && std::isfinite(value.nominal().imag()) && std::isfinite(value.variance());
        } else {
            return std::isfinite(value.nominal()) && std::isfinite(static_cast<real_type>(value.variance()));
        }
    } else {
        return std::isfinite(value);
    }
}

} // namespace scuq::math

#endif // SCUQ_UNCERTAINVALUE_HPP
