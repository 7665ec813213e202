#ifndef SCUQ_UNITFORMATTER_HPP
#define SCUQ_UNITFORMATTER_HPP

#include <concepts>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

#include <scuq/Exception.hpp>
#include <scuq/Rational.hpp>
#include <scuq/Unit.hpp>
#include <scuq/meta/formatter.hpp>
#include <scuq/si.hpp>

template<>
struct fmt::formatter<scuq::Rational> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const scuq::Rational& value, FormatContext& ctx) const {
        if (value.isInteger()) {
            return fmt::format_to(ctx.out(), "{}", value.numerator());
        }
        return fmt::format_to(ctx.out(), "{}/{}", value.numerator(), value.denominator());
    }
};

template<>
struct fmt::formatter<scuq::Dimension> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(scuq::Dimension dimension, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", scuq::dimensionName(dimension));
    }
};

namespace scuq {

/// unit displayed with the symbols of a caller-provided table, e.g. a copy of si::units() extended by "mV" or "V/m"
struct UnitWithSymbols {
    const Unit&          unit;
    const si::UnitTable& table;
};

[[nodiscard]] inline UnitWithSymbols withSymbols(const Unit& unit, const si::UnitTable& table) noexcept { return {unit, table}; }

namespace detail {
template<typename OutputIt>
OutputIt formatUnit(OutputIt out, const Unit& unit, const si::UnitTable& table) {
    if (const auto symbol = table.symbolOf(unit); symbol.has_value()) {
        return fmt::format_to(out, "{}", *symbol);
    }
    std::vector<std::string> factors;
    if (!unit.isCoherent() || unit.isDimensionless()) {
        factors.push_back(fmt::format("{:g}", unit.scale()));
    }
    for (const Dimension dimension : kDimensions) {
        const Rational exponent = unit.exponent(dimension);
        if (exponent.isZero()) {
            continue;
        }
        if (exponent == Rational{1}) {
            factors.emplace_back(baseUnitSymbol(dimension));
        } else if (exponent.isInteger()) {
            factors.push_back(fmt::format("{}^{}", baseUnitSymbol(dimension), exponent));
        } else {
            factors.push_back(fmt::format("{}^({})", baseUnitSymbol(dimension), exponent));
        }
    }
    return fmt::format_to(out, "{}", join(factors, "·"));
}
} // namespace detail

} // namespace scuq

/**
 * Units registered in the SI catalogue print as their symbol ("N", "km", "Ω"), all others as scale and base-unit
 * factors, e.g. "m·s^-2", "1000·m^(1/2)", or "1" for the coherent dimensionless unit.
 */
template<>
struct fmt::formatter<scuq::Unit> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const scuq::Unit& unit, FormatContext& ctx) const {
        return scuq::detail::formatUnit(ctx.out(), unit, scuq::si::units());
    }
};

template<>
struct fmt::formatter<scuq::UnitWithSymbols> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const scuq::UnitWithSymbols& value, FormatContext& ctx) const {
        return scuq::detail::formatUnit(ctx.out(), value.unit, value.table);
    }
};

template<typename E>
requires std::derived_from<E, scuq::exception>
struct fmt::formatter<E> {
    char presentation = 's';

    constexpr auto parse(fmt::format_parse_context& ctx) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && (*it == 's' || *it == 'f')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw fmt::format_error("invalid format specifier for scuq::exception");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const E& error, FormatContext& ctx) const {
        if (presentation == 'f') {
            return fmt::format_to(ctx.out(), "{} at {:f}", error.message, error.sourceLocation);
        }
        return fmt::format_to(ctx.out(), "{} at {:t}", error.message, error.sourceLocation);
    }
};

namespace scuq {
inline std::ostream& operator<<(std::ostream& os, const Rational& value) { return os << fmt::format("{}", value); }
inline std::ostream& operator<<(std::ostream& os, Dimension dimension) { return os << fmt::format("{}", dimension); }
inline std::ostream& operator<<(std::ostream& os, const Unit& unit) { return os << fmt::format("{}", unit); }
} // namespace scuq

#endif // SCUQ_UNITFORMATTER_HPP
