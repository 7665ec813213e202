#ifndef SCUQ_QUANTITYFORMATTER_HPP
#define SCUQ_QUANTITYFORMATTER_HPP

#include <ostream>

#include <fmt/format.h>

#include <scuq/Quantity.hpp>
#include <scuq/UncertainValue.hpp>
#include <scuq/formatter/UnitFormatter.hpp>
#include <scuq/meta/formatter.hpp>

// "(nominal ± standard deviation)", the format specifier applies to both numbers
template<scuq::meta::UncertaintyScalar T>
struct fmt::formatter<scuq::UncertainValue<T>> {
    fmt::formatter<T> value_formatter;

    constexpr auto parse(fmt::format_parse_context& ctx) { return value_formatter.parse(ctx); }

    template<typename FormatContext>
    auto format(const scuq::UncertainValue<T>& uv, FormatContext& ctx) const {
        using real_type = typename scuq::UncertainValue<T>::real_type;
        auto out        = ctx.out();
        out             = fmt::format_to(out, "(");
        ctx.advance_to(out);
        out = value_formatter.format(uv.nominal(), ctx);
        out = fmt::format_to(out, " ± ");
        ctx.advance_to(out);
        out = value_formatter.format(static_cast<T>(static_cast<real_type>(uv.standardDeviation())), ctx);
        return fmt::format_to(out, ")");
    }
};

// "(nominal ± standard deviation) unit", the unit is omitted for the coherent dimensionless unit
template<scuq::meta::UncertaintyScalar T>
struct fmt::formatter<scuq::Quantity<T>> {
    fmt::formatter<scuq::UncertainValue<T>> value_formatter;

    constexpr auto parse(fmt::format_parse_context& ctx) { return value_formatter.parse(ctx); }

    template<typename FormatContext>
    auto format(const scuq::Quantity<T>& q, FormatContext& ctx) const {
        auto out = value_formatter.format(q.value(), ctx);
        if (q.unit() == scuq::Unit::dimensionless()) {
            return out;
        }
        return fmt::format_to(out, " {}", q.unit());
    }
};

namespace scuq {
template<meta::UncertaintyScalar T>
struct QuantityWithSymbols {
    const Quantity<T>&   quantity;
    const si::UnitTable& table;
};

/// quantity displayed with the unit symbols of a caller-provided table, see withSymbols(const Unit&, const si::UnitTable&)
template<meta::UncertaintyScalar T>
[[nodiscard]] QuantityWithSymbols<T> withSymbols(const Quantity<T>& quantity, const si::UnitTable& table) noexcept {
    return {quantity, table};
}
} // namespace scuq

template<scuq::meta::UncertaintyScalar T>
struct fmt::formatter<scuq::QuantityWithSymbols<T>> {
    fmt::formatter<scuq::UncertainValue<T>> value_formatter;

    constexpr auto parse(fmt::format_parse_context& ctx) { return value_formatter.parse(ctx); }

    template<typename FormatContext>
    auto format(const scuq::QuantityWithSymbols<T>& value, FormatContext& ctx) const {
        auto out = value_formatter.format(value.quantity.value(), ctx);
        if (value.quantity.unit() == scuq::Unit::dimensionless()) {
            return out;
        }
        out = fmt::format_to(out, " ");
        return scuq::detail::formatUnit(out, value.quantity.unit(), value.table);
    }
};

namespace scuq {
template<meta::UncertaintyScalar T>
std::ostream& operator<<(std::ostream& os, const UncertainValue<T>& v) {
    return os << fmt::format("{}", v);
}

template<meta::UncertaintyScalar T>
std::ostream& operator<<(std::ostream& os, const Quantity<T>& q) {
    return os << fmt::format("{}", q);
}
} // namespace scuq

#endif // SCUQ_QUANTITYFORMATTER_HPP
