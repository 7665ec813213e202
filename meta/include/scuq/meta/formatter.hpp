#ifndef SCUQ_META_FORMATTER_HPP
#define SCUQ_META_FORMATTER_HPP

#include <complex>
#include <concepts>
#include <iterator>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace scuq {

template<std::ranges::input_range R>
std::string join(const R& range, std::string_view sep = ", ") {
    std::string out;
    auto        it  = std::ranges::begin(range);
    const auto  end = std::ranges::end(range);
    if (it != end) {
        out += fmt::format("{}", *it);
        while (++it != end) {
            out += fmt::format("{}{}", sep, *it);
        }
    }
    return out;
}

} // namespace scuq

template<>
struct fmt::formatter<std::source_location> {
    char presentation = 's';

    constexpr auto parse(fmt::format_parse_context& ctx) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && (*it == 's' || *it == 'f' || *it == 't')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw fmt::format_error("invalid format specifier for source_location");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const std::source_location& loc, FormatContext& ctx) const {
        switch (presentation) {
        case 's': return fmt::format_to(ctx.out(), "{}", loc.file_name());
        case 't': return fmt::format_to(ctx.out(), "{}:{}", loc.file_name(), loc.line());
        case 'f':
        default: return fmt::format_to(ctx.out(), "{}:{} in {}", loc.file_name(), loc.line(), loc.function_name());
        }
    }
};

// accepts an optional precision and one of e, E, f, F, g, G, e.g. "{:.3f}"; the precision applies to both parts
template<std::floating_point T>
struct fmt::formatter<std::complex<T>> {
    char presentation = 'g'; // default format
    int  precision    = 6;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && *it == '.') {
            ++it;
            if (it == end || *it < '0' || *it > '9') {
                throw fmt::format_error("missing precision");
            }
            precision = 0;
            while (it != end && *it >= '0' && *it <= '9') {
                precision = 10 * precision + (*it++ - '0');
                if (precision > 1000) {
                    throw fmt::format_error("precision too large");
                }
            }
        }
        if (it != end && (*it == 'f' || *it == 'F' || *it == 'e' || *it == 'E' || *it == 'g' || *it == 'G')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw fmt::format_error("invalid format");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const std::complex<T>& value, FormatContext& ctx) const {
        const auto imag = value.imag();
        switch (presentation) {
        case 'e': return imag == 0 ? fmt::format_to(ctx.out(), "{:.{}e}", value.real(), precision) : fmt::format_to(ctx.out(), "({:.{}e}{:+.{}e}i)", value.real(), precision, imag, precision);
        case 'E': return imag == 0 ? fmt::format_to(ctx.out(), "{:.{}E}", value.real(), precision) : fmt::format_to(ctx.out(), "({:.{}E}{:+.{}E}i)", value.real(), precision, imag, precision);
        case 'f': return imag == 0 ? fmt::format_to(ctx.out(), "{:.{}f}", value.real(), precision) : fmt::format_to(ctx.out(), "({:.{}f}{:+.{}f}i)", value.real(), precision, imag, precision);
        case 'F': return imag == 0 ? fmt::format_to(ctx.out(), "{:.{}F}", value.real(), precision) : fmt::format_to(ctx.out(), "({:.{}F}{:+.{}F}i)", value.real(), precision, imag, precision);
        case 'G': return imag == 0 ? fmt::format_to(ctx.out(), "{:.{}G}", value.real(), precision) : fmt::format_to(ctx.out(), "({:.{}G}{:+.{}G}i)", value.real(), precision, imag, precision);
        case 'g':
        default: return imag == 0 ? fmt::format_to(ctx.out(), "{:.{}g}", value.real(), precision) : fmt::format_to(ctx.out(), "({:.{}g}{:+.{}g}i)", value.real(), precision, imag, precision);
        }
    }
};

#endif // SCUQ_META_FORMATTER_HPP
