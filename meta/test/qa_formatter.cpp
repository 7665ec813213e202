#include <boost/ut.hpp>

#include <array>
#include <complex>
#include <list>
#include <source_location>
#include <string>
#include <tuple>
#include <vector>

#include <fmt/format.h>

#include <scuq/meta/formatter.hpp>

namespace scuq::meta::test {

const boost::ut::suite<"Source Location formatter"> sourceLocationFormatter = [] {
    using namespace boost::ut;

    "fmt::formatter<std::source_location>"_test = [] {
        const auto loc = std::source_location::current();
        expect(eq(fmt::format("{:s}", loc), std::string(loc.file_name())));
        expect(eq(fmt::format("{}", loc), std::string(loc.file_name())));
        expect(fmt::format("{:t}", loc).ends_with(fmt::format(":{}", loc.line())));
        expect(fmt::format("{:f}", loc).find(" in ") != std::string::npos);
    };
};

const boost::ut::suite<"scuq::join helper"> joinHelpers = [] {
    using namespace boost::ut;
    using namespace std::literals::string_literals;

    "scuq::join<vector<int>>"_test = [] {
        std::vector<int> v{1, 2, 3};
        expect(eq("1, 2, 3"s, scuq::join(v)));
        expect(eq("1; 2; 3"s, scuq::join(v, "; ")));
    };

    "scuq::join<list<string>>"_test = [] {
        std::list<std::string> l{"m", "s^-1"};
        expect(eq("m·s^-1"s, scuq::join(l, "·")));
    };

    "scuq::join of empty range"_test = [] { expect(eq(""s, scuq::join(std::array<int, 0>{}))); };
};

const boost::ut::suite<"std::complex formatter"> complexFormatter = [] {
    using namespace boost::ut;
    using namespace std::literals::string_literals;
    using C = std::complex<double>;

    "fmt::formatter<std::complex<T>>"_test = [] {
        expect(eq("(1+1i)"s, fmt::format("{}", C(1., +1.))));
        expect(eq("(1-1i)"s, fmt::format("{}", C(1., -1.))));
        expect(eq("1"s, fmt::format("{}", C(1., 0.))));
        expect(eq("(1.234+1.12346e+12i)"s, fmt::format("{}", C(1.234, 1123456789012))));
        expect(eq("(1.12346E+12+1.234i)"s, fmt::format("{:G}", C(1123456789012, 1.234))));
        expect(eq("1.12346e+12"s, fmt::format("{:g}", C(1123456789012, 0))));

        expect(eq("(1.000000+1.000000i)"s, fmt::format("{:f}", C(1., +1.))));
        expect(eq("(1.000000-1.000000i)"s, fmt::format("{:F}", C(1., -1.))));
        expect(eq("1.000000"s, fmt::format("{:f}", C(1., 0.))));

        expect(eq("(1.000000e+00+1.000000e+00i)"s, fmt::format("{:e}", C(1., +1.))));
        expect(eq("(1.000000E+00-1.000000E+00i)"s, fmt::format("{:E}", C(1., -1.))));
        expect(eq("1.000000e+00"s, fmt::format("{:e}", C(1., 0.))));
    };

    "explicit precision"_test = [] {
        expect(eq("(1.00-1.00i)"s, fmt::format("{:.2f}", C(1., -1.))));
        expect(eq("0.500"s, fmt::format("{:.3f}", C(0.5, 0.))));
        expect(eq("(1.2e+00+3.5e-01i)"s, fmt::format("{:.1e}", C(1.2, 0.35))));
        expect(eq("(3.14+2.72i)"s, fmt::format("{:.3}", C(3.14159, 2.71828)))) << "precision without presentation uses g";
        expect(throws<fmt::format_error>([] { std::ignore = fmt::format(fmt::runtime("{:.f}"), C(1., 1.)); }));
        expect(throws<fmt::format_error>([] { std::ignore = fmt::format(fmt::runtime("{:x}"), C(1., 1.)); }));
    };

    "float precision"_test = [] { expect(eq("(0.5-0.25i)"s, fmt::format("{}", std::complex<float>(0.5f, -0.25f)))); };
};

} // namespace scuq::meta::test

int main() { /* tests are statically executed */ }
