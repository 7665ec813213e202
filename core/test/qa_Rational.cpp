#include <boost/ut.hpp>

#include <compare>
#include <cstdint>
#include <limits>

#include <fmt/format.h>

#include <scuq/Rational.hpp>
#include <scuq/formatter/UnitFormatter.hpp>

namespace scuq::test {

const boost::ut::suite<"Rational"> rationalTests = [] {
    using namespace boost::ut;

    "normalisation"_test = [] {
        expect(Rational{2, 4} == Rational{1, 2});
        expect(Rational{3, -6} == Rational{-1, 2});
        expect(eq(Rational{3, -6}.denominator(), 2));
        expect(eq(Rational{0, 7}.denominator(), 1));
        expect(Rational{6, 3}.isInteger());
        expect(Rational{0, 5}.isZero());
    };

    "arithmetic"_test = [] {
        expect(Rational{1, 2} + Rational{1, 3} == Rational{5, 6});
        expect(Rational{1, 2} - Rational{1, 3} == Rational{1, 6});
        expect(Rational{2, 3} * Rational{3, 4} == Rational{1, 2});
        expect(Rational{1, 2} / Rational{1, 4} == Rational{2});
        expect(-Rational{1, 3} == Rational{-1, 3});
        expect(Rational{3, 4}.inverse() == Rational{4, 3});

        Rational r{1, 2};
        r += Rational{1, 2};
        expect(r == Rational{1});
        r *= Rational{3};
        expect(r == Rational{3});
    };

    "ordering"_test = [] {
        expect(Rational{1, 3} < Rational{1, 2});
        expect(Rational{-1, 2} < Rational{1, 3});
        expect(Rational{2, 4} <= Rational{1, 2});
        expect(Rational{7, 3} > Rational{2});

        constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
        expect(Rational{max, max - 1} < Rational{max - 1, max - 2}) << "cross products exceed 64 bits";
        expect(Rational{-max, max - 1} > Rational{-(max - 1), max - 2});
        expect(Rational{max - 1, max} < Rational{1});
        expect(Rational{-max} < Rational{-max + 1, max});
        expect((Rational{max, 3} <=> Rational{max, 3}) == std::strong_ordering::equal);
    };

    "floating point conversion"_test = [] {
        expect(eq(Rational{1, 4}.toFloatingPoint(), 0.25));
        expect(eq(Rational{-3, 2}.toFloatingPoint<float>(), -1.5f));
    };

    "fromDouble"_test = [] {
        expect(Rational::fromDouble(0.5) == Rational{1, 2});
        expect(Rational::fromDouble(-0.25) == Rational{-1, 4});
        expect(Rational::fromDouble(1.0 / 3.0) == Rational{1, 3});
        expect(Rational::fromDouble(2.0) == Rational{2});
        expect(Rational::fromDouble(1.5) == Rational{3, 2});
        expect(!Rational::fromDouble(3.141592653589793).has_value()) << "pi has no small-denominator representation";
        expect(!Rational::fromDouble(std::numeric_limits<double>::quiet_NaN()).has_value());
        expect(!Rational::fromDouble(0.001, 100).has_value()) << "denominator exceeds limit";
    };

    "errors"_test = [] {
        expect(throws<DivisionByZeroError>([] { [[maybe_unused]] Rational r{1, 0}; }));
        expect(throws<DivisionByZeroError>([] { [[maybe_unused]] auto r = Rational{0}.inverse(); }));
        expect(throws<FractionalDimensionError>([] { [[maybe_unused]] auto r = Rational{std::numeric_limits<std::int64_t>::max()} * Rational{2}; }));
        expect(throws<FractionalDimensionError>([] { [[maybe_unused]] auto r = Rational{1, std::numeric_limits<std::int64_t>::max()} + Rational{1, std::numeric_limits<std::int64_t>::max() - 1}; }));
    };

    "values at the 64-bit limits"_test = [] {
        constexpr std::int64_t min = std::numeric_limits<std::int64_t>::min();
        constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
        expect(throws<FractionalDimensionError>([] { [[maybe_unused]] Rational r{min}; })) << "INT64_MIN has no negation";
        expect(throws<FractionalDimensionError>([] { [[maybe_unused]] Rational r = min; }));
        expect(throws<FractionalDimensionError>([] { [[maybe_unused]] auto r = Rational{-1} - Rational{max}; })) << "result would be INT64_MIN";
        expect(throws<FractionalDimensionError>([] { [[maybe_unused]] auto r = Rational{-2} - Rational{max}; }));
        expect(throws<FractionalDimensionError>([] { [[maybe_unused]] auto r = Rational{-max} * Rational{2}; }));
        expect(-Rational{-max} == Rational{max});
        expect(Rational{1} - Rational{max} == Rational{-(max - 1)});
        expect(eq((Rational{max} + Rational{-max}).numerator(), 0));
    };

    "formatting"_test = [] {
        expect(eq(fmt::format("{}", Rational{1, 2}), std::string("1/2")));
        expect(eq(fmt::format("{}", Rational{-3}), std::string("-3")));
    };
};

} // namespace scuq::test

int main() { /* tests are statically executed */ }
