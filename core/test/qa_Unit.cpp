#include <boost/ut.hpp>

#include <cmath>
#include <limits>
#include <numbers>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_set>

#include <fmt/format.h>

#include <scuq/Unit.hpp>
#include <scuq/formatter/UnitFormatter.hpp>
#include <scuq/si.hpp>

namespace scuq::test {

const boost::ut::suite<"Unit algebra"> unitAlgebra = [] {
    using namespace boost::ut;

    "base units"_test = [] {
        const Unit metre = Unit::base(Dimension::Length);
        expect(metre.exponent(Dimension::Length) == Rational{1});
        expect(metre.exponent(Dimension::Time) == Rational{0});
        expect(eq(metre.scale(), 1.0));
        expect(!metre.isDimensionless());
        expect(Unit::dimensionless().isDimensionless());
        expect(Unit{} == Unit::dimensionless());
    };

    "multiply adds exponents and multiplies scales"_test = [] {
        const Unit product = si::metre.scaled(1e3) * si::second;
        expect(product.exponent(Dimension::Length) == Rational{1});
        expect(product.exponent(Dimension::Time) == Rational{1});
        expect(eq(product.scale(), 1e3));
    };

    "divide subtracts exponents and divides scales"_test = [] {
        const Unit speed = si::kilometre / si::hour;
        expect(speed.exponent(Dimension::Length) == Rational{1});
        expect(speed.exponent(Dimension::Time) == Rational{-1});
        expect(std::abs(speed.scale() - 1.0 / 3.6) < 1e-15);
        expect((si::metre / si::metre).isDimensionless());
    };

    "power and root"_test = [] {
        const Unit area = si::metre.power(2);
        expect(area.exponent(Dimension::Length) == Rational{2});
        const Unit rootMetre = si::metre.root(2);
        expect(rootMetre.exponent(Dimension::Length) == Rational{1, 2});
        expect(rootMetre.power(2) == si::metre);
        expect(si::metre.power(0.5) == rootMetre) << "0.5 is recovered as 1/2";
        expect(si::kilometre.power(2).scale() == 1e6);
        expect(std::abs(si::kilometre.power(Rational{1, 3}).scale() - 10.0) < 1e-12);
        expect(si::second.inverse() == si::hertz);
    };

    "non-representable exponents"_test = [] {
        expect(throws<FractionalDimensionError>([] { std::ignore = si::metre.power(std::numbers::pi); }));
        expect(throws<FractionalDimensionError>([] { std::ignore = si::metre.power(std::sqrt(2.0)); }));
        expect(nothrow([] { std::ignore = si::one.power(std::numbers::pi); })) << "dimensionless units accept any real exponent";
        expect(throws<DomainError>([] { std::ignore = si::metre.power(std::numeric_limits<double>::infinity()); }));
        expect(throws<DivisionByZeroError>([] { std::ignore = si::metre.root(0); }));
    };

    "compatibility ignores scale"_test = [] {
        expect(si::metre.isCompatibleWith(si::kilometre));
        expect(!si::metre.isCompatibleWith(si::second));
        expect(si::joule.isCompatibleWith(si::newton * si::metre));
        expect(si::metre != si::kilometre) << "equality requires equal scale";
    };

    "conversion factor"_test = [] {
        expect(eq(si::kilometre.conversionFactorTo(si::metre), 1000.0));
        expect(eq(si::metre.conversionFactorTo(si::kilometre), 1e-3));
        expect(eq(si::hour.conversionFactorTo(si::minute), 60.0));
        expect(throws<IncompatibleUnitsError>([] { std::ignore = si::metre.conversionFactorTo(si::second); }));
    };

    "scaled units"_test = [] {
        expect(si::kilo * si::metre == si::kilometre);
        expect(si::metre * si::milli == si::millimetre);
        expect((si::kilometre / si::kilo) == si::metre);
        expect(throws<DomainError>([] { std::ignore = si::metre.scaled(0.0); }));
        expect(throws<DomainError>([] { std::ignore = si::metre.scaled(-1.0); }));
        expect(throws<DomainError>([] { std::ignore = si::metre.scaled(std::numeric_limits<double>::quiet_NaN()); }));
        expect(si::kilometre.coherent() == si::metre);
        expect(si::metre.isCoherent() && !si::kilometre.isCoherent());
    };

    "hash matches equality"_test = [] {
        std::unordered_set<Unit> units{si::metre, si::kilometre, si::newton, si::kilogram * si::metre / (si::second * si::second)};
        expect(eq(units.size(), 3UZ)) << "N and kg·m·s^-2 are the same unit";
        expect(units.contains(si::metre));
        expect(!units.contains(si::second));
    };

    "constexpr units"_test = [] {
        constexpr Unit acceleration = si::metre / (si::second * si::second);
        static_assert(acceleration.exponent(Dimension::Time) == Rational{-2});
        static_assert(si::volt.exponent(Dimension::Mass) == Rational{1});
        static_assert(si::volt.exponent(Dimension::Current) == Rational{-1});
        static_assert(si::ohm == si::volt / si::ampere);
        expect(acceleration.isCompatibleWith(si::newton / si::kilogram));
    };
};

const boost::ut::suite<"Unit formatting"> unitFormatting = [] {
    using namespace boost::ut;

    "symbols from the SI catalogue"_test = [] {
        expect(eq(fmt::format("{}", si::metre), std::string("m")));
        expect(eq(fmt::format("{}", si::newton), std::string("N")));
        expect(eq(fmt::format("{}", si::kilometre), std::string("km")));
        expect(eq(fmt::format("{}", si::one), std::string("1")));
        expect(eq(fmt::format("{}", si::hertz), std::string("Hz")));
    };

    "composed units"_test = [] {
        expect(eq(fmt::format("{}", si::metre / (si::second * si::second)), std::string("m·s^-2")));
        expect(eq(fmt::format("{}", si::metre.root(2)), std::string("m^(1/2)")));
        expect(eq(fmt::format("{}", (si::metre * si::second).scaled(1000.0)), std::string("1000·m·s")));
        expect(eq(fmt::format("{}", si::one.scaled(0.5)), std::string("0.5")));
    };

    "caller-provided symbol tables"_test = [] {
        const Unit fieldStrength = si::volt / si::metre;
        expect(eq(fmt::format("{}", fieldStrength), std::string("m·kg·s^-3·A^-1")));

        si::UnitTable extended = si::units();
        expect(extended.add("V/m", fieldStrength));
        expect(!extended.add("V", si::volt)) << "symbols stay unique";
        expect(eq(fmt::format("{}", withSymbols(fieldStrength, extended)), std::string("V/m")));
        expect(eq(fmt::format("{}", withSymbols(si::newton, extended)), std::string("N")));
        expect(eq(fmt::format("{}", fieldStrength), std::string("m·kg·s^-3·A^-1"))) << "the SI catalogue is unchanged";
        expect(!si::units().contains("V/m"));

        si::UnitTable custom;
        expect(custom.add("mV", si::volt / 1000.0));
        expect(eq(fmt::format("{}", withSymbols(si::volt.scaled(si::milli), custom)), std::string("mV")));
        expect(eq(fmt::format("{}", withSymbols(si::metre, custom)), std::string("m"))) << "falls back to base-unit factors";
        expect(eq(fmt::format("{}", withSymbols(si::metre.scaled(0.3048), custom)), std::string("0.3048·m")));
    };

    "dimension names"_test = [] {
        expect(eq(fmt::format("{}", Dimension::LuminousIntensity), std::string("luminous intensity")));
        expect(eq(baseUnitSymbol(Dimension::Mass), std::string_view("kg")));
    };

    "exception formatting"_test = [] {
        try {
            std::ignore = si::metre.conversionFactorTo(si::second);
            expect(false) << "conversion should have thrown";
        } catch (const IncompatibleUnitsError& e) {
            const std::string text = fmt::format("{}", e);
            expect(text.find("'m'") != std::string::npos);
            expect(text.find("'s'") != std::string::npos);
            expect(std::string_view(e.what()).find(" at ") != std::string_view::npos);
        }
    };
};

} // namespace scuq::test

int main() { /* tests are statically executed */ }
