#include <scuq/Unit.hpp>

#include <cmath>

#include <fmt/format.h>

#include <scuq/formatter/UnitFormatter.hpp>

namespace scuq {

double Unit::conversionFactorTo(const Unit& target, std::source_location location) const {
    if (!isCompatibleWith(target)) [[unlikely]] {
        throw IncompatibleUnitsError(fmt::format("cannot convert '{}' to '{}'", *this, target), location);
    }
    return _scale / target._scale;
}

Unit Unit::power(const Rational& exponent, std::source_location location) const {
    Exponents result{};
    std::ranges::transform(_exponents, result.begin(), [&](const Rational& value) { return value.multiply(exponent, location); });
    const double scale = exponent.isInteger() ? std::pow(_scale, static_cast<double>(exponent.numerator())) : std::pow(_scale, exponent.toFloatingPoint());
    return {result, scale, location};
}

Unit Unit::power(double exponent, std::source_location location) const {
    if (!std::isfinite(exponent)) [[unlikely]] {
        throw DomainError(fmt::format("non-finite unit exponent {}", exponent), location);
    }
    if (const auto rational = Rational::fromDouble(exponent); rational.has_value()) {
        return power(*rational, location);
    }
    if (!isDimensionless()) [[unlikely]] {
        throw FractionalDimensionError(fmt::format("'{}'^{} has no exact rational exponent", *this, exponent), location);
    }
    return {_exponents, std::pow(_scale, exponent), location};
}

} // namespace scuq
