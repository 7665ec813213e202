#include <boost/ut.hpp>

#include <complex>

#include <scuq/Component.hpp>
#include <scuq/SensitivityMap.hpp>
#include <scuq/meta/UnitTestHelper.hpp>

namespace scuq::test {

const boost::ut::suite<"SensitivityMap<double>"> realMapTests = [] {
    using namespace boost::ut;
    using Map = SensitivityMap<double>;

    "empty map is certain"_test = [] {
        const Map empty;
        expect(empty.empty());
        expect(eq(empty.variance(), 0.0));
    };

    "singleton"_test = [] {
        const Component c = ComponentRegistry::newComponent(4.0);
        const Map       m = Map::fromComponent(c, 3.0);
        expect(eq(m.size(), 1UZ));
        expect(m.contains(c));
        expect(eq(m.coefficient(c), 3.0));
        expect(approx(m.variance(), 36.0, 1e-12)) << "3^2 * 4";
        expect(Map::fromComponent(c, 0.0).empty()) << "zero coefficients are not stored";
    };

    "scale"_test = [] {
        const Component c = ComponentRegistry::newComponent(1.0);
        const Map       m = Map::fromComponent(c, 2.0).scale(-1.5);
        expect(eq(m.coefficient(c), -3.0));
        expect(Map::fromComponent(c).scale(0.0).empty());
    };

    "add merges shared components and passes others through"_test = [] {
        const Component a  = ComponentRegistry::newComponent(1.0);
        const Component b  = ComponentRegistry::newComponent(2.0);
        const Component c  = ComponentRegistry::newComponent(3.0);
        const Map       m1 = Map::fromTerms({{a, 1.0}, {b, 2.0}});
        const Map       m2 = Map::fromTerms({{b, 3.0}, {c, 4.0}});
        const Map       m  = m1.add(m2);
        expect(eq(m.size(), 3UZ));
        expect(eq(m.coefficient(a), 1.0));
        expect(eq(m.coefficient(b), 5.0));
        expect(eq(m.coefficient(c), 4.0));
        expect(eq(m1.coefficient(b), 2.0)) << "operands are not modified";
    };

    "exact cancellation drops the component"_test = [] {
        const Component a = ComponentRegistry::newComponent(1.0);
        const Map       m = Map::fromComponent(a, 2.0).combine(1.0, Map::fromComponent(a, 1.0), -2.0);
        expect(m.empty());
        expect(!m.contains(a));
    };

    "fromTerms sums repeated components in any order"_test = [] {
        const Component a = ComponentRegistry::newComponent(1.0);
        const Component b = ComponentRegistry::newComponent(1.0);
        const Map       m = Map::fromTerms({{b, 1.0}, {a, 2.0}, {b, -1.0}, {a, 0.5}});
        expect(eq(m.size(), 1UZ));
        expect(eq(m.coefficient(a), 2.5));
        expect(m.begin()->component == a);
    };

    "variance with custom lookup"_test = [] {
        const Component a = ComponentRegistry::newComponent(1.0);
        const Map       m = Map::fromComponent(a, 2.0);
        expect(approx(m.variance([](const Component&) { return 9.0; }), 36.0, 1e-12));
    };

    "covariance over shared components only"_test = [] {
        const Component a  = ComponentRegistry::newComponent(4.0);
        const Component b  = ComponentRegistry::newComponent(9.0);
        const Map       m1 = Map::fromTerms({{a, 1.0}, {b, 1.0}});
        const Map       m2 = Map::fromComponent(a, 2.0);
        expect(approx(m1.covariance(m2), 8.0, 1e-12)) << "1 * 2 * 4";
        expect(approx(m1.covariance(Map::fromComponent(ComponentRegistry::newComponent(1.0))), 0.0, 1e-12)) << "disjoint components";
        expect(approx(m1.covariance(m1), m1.variance(), 1e-12)) << "self-covariance";
    };
};

const boost::ut::suite<"SensitivityMap<std::complex<double>>"> complexMapTests = [] {
    using namespace boost::ut;
    using namespace std::complex_literals;
    using Map = SensitivityMap<std::complex<double>>;

    "variance sums |c|^2"_test = [] {
        const Component a = ComponentRegistry::newComponent(2.0);
        const Map       m = Map::fromComponent(a, 3.0 + 4.0i);
        expect(approx(m.variance(), 50.0, 1e-12)) << "|3+4i|^2 * 2";
    };

    "Hermitian covariance"_test = [] {
        const Component a  = ComponentRegistry::newComponent(1.0);
        const Map       m1 = Map::fromComponent(a, 1.0i);
        const Map       m2 = Map::fromComponent(a, 1.0);
        expect(approx(m1.covariance(m2), std::complex<double>{0.0, 1.0}, 1e-12));
        expect(approx(m2.covariance(m1), std::complex<double>{0.0, -1.0}, 1e-12)) << "cov(b, a) = conj(cov(a, b))";
    };

    "2x2 real covariance matrix"_test = [] {
        const Component a      = ComponentRegistry::newComponent(1.0);
        const Component b      = ComponentRegistry::newComponent(4.0);
        const Map       m      = Map::fromTerms({{a, {1.0, 1.0}}, {b, {0.0, 1.0}}}); // Re = a, Im = a + b
        const auto      matrix = m.covarianceMatrix(m);
        expect(approxMatrix(matrix, {{{1.0, 1.0}, {1.0, 5.0}}}, 1e-12));
    };

    "promotion from real map"_test = [] {
        const Component              a    = ComponentRegistry::newComponent(1.0);
        const SensitivityMap<double> real = SensitivityMap<double>::fromComponent(a, 2.0);
        const Map                    promoted{real};
        expect(approx(promoted.coefficient(a), std::complex<double>{2.0, 0.0}, 1e-12));
    };

    "transform to the imaginary part"_test = [] {
        const Component a  = ComponentRegistry::newComponent(1.0);
        const Component b  = ComponentRegistry::newComponent(1.0);
        const Map       m  = Map::fromTerms({{a, {1.0, 0.0}}, {b, {0.0, 2.0}}});
        const auto      im = m.transform<double>([](const std::complex<double>& c) { return c.imag(); });
        expect(eq(im.size(), 1UZ)) << "zero imaginary coefficient of a is dropped";
        expect(eq(im.coefficient(b), 2.0));
    };
};

} // namespace scuq::test

int main() { /* tests are statically executed */ }
