#include <boost/ut.hpp>

#include <string>
#include <string_view>

#include <scuq/si.hpp>

namespace scuq::test {

const boost::ut::suite<"SI catalogue"> siCatalogue = [] {
    using namespace boost::ut;

    "coherent derived units"_test = [] {
        expect(si::newton == si::kilogram * si::metre / (si::second * si::second));
        expect(si::joule == si::watt * si::second);
        expect(si::volt == si::joule / si::coulomb);
        expect(si::farad == si::coulomb / si::volt);
        expect(si::siemens == si::ohm.inverse());
        expect(si::tesla == si::weber / (si::metre * si::metre));
        expect(si::henry == si::ohm * si::second);
        expect(si::pascal.isCompatibleWith(si::joule / si::litre));
        expect(si::radian.isDimensionless() && si::steradian.isDimensionless());
    };

    "prefixes"_test = [] {
        const auto& prefixes = si::prefixes();
        expect(eq(prefixes.size(), 24UZ));
        expect(eq(prefixes.front().name, std::string_view("quecto")));
        expect(eq(prefixes.front().factor, 1e-30));
        expect(eq(prefixes.back().symbol, std::string_view("Q")));
        expect(eq(si::gram.scale(), 1e-3));
    };

    "table lookup"_test = [] {
        const si::UnitTable& table = si::units();
        expect(table.find("N") == si::newton);
        expect(table.find("km") == si::kilometre);
        expect(table.find("kg") == si::kilogram);
        expect(table.find("mg") == si::gram.scaled(si::milli));
        expect(table.find("µV") == si::volt.scaled(si::micro));
        expect(table.find("%") == si::percent);
        expect(!table.find("furlong").has_value());
        expect(table.contains("Ω"));
    };

    "preferred symbols"_test = [] {
        const si::UnitTable& table = si::units();
        expect(table.symbolOf(si::hertz) == std::string_view("Hz")) << "hertz is registered before becquerel";
        expect(table.symbolOf(si::one) == std::string_view("1"));
        expect(table.symbolOf(si::kilogram) == std::string_view("kg"));
        expect(!table.symbolOf(si::metre / (si::second * si::second)).has_value());
    };

    "table is built once"_test = [] {
        expect(&si::units() == &si::units());
        expect(si::units().size() > 400UZ);
    };
};

} // namespace scuq::test

int main() { /* tests are statically executed */ }
