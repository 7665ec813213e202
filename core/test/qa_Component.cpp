#include <boost/ut.hpp>

#include <cmath>
#include <limits>
#include <thread>
#include <tuple>
#include <unordered_set>
#include <vector>

#include <scuq/Component.hpp>
#include <scuq/Exception.hpp>

namespace scuq::test {

const boost::ut::suite<"Component registry"> componentTests = [] {
    using namespace boost::ut;

    "new component keeps its variance"_test = [] {
        const Component c = ComponentRegistry::newComponent(4.0);
        expect(eq(c.variance(), 4.0));
        expect(eq(c.standardUncertainty(), 2.0));
        expect(c.id() > 0UZ);
    };

    "from standard uncertainty"_test = [] {
        const Component c = ComponentRegistry::fromStandardUncertainty(3.0);
        expect(eq(c.variance(), 9.0));
    };

    "identical variance does not imply identity"_test = [] {
        const Component a = ComponentRegistry::newComponent(1.0);
        const Component b = ComponentRegistry::newComponent(1.0);
        expect(a != b);
        expect(a < b) << "ids are allocated monotonically";
        const Component copy = a;
        expect(copy == a);
    };

    "zero variance is a valid (certain) component"_test = [] { expect(eq(ComponentRegistry::newComponent(0.0).variance(), 0.0)); };

    "invalid variance"_test = [] {
        expect(throws<InvalidUncertaintyError>([] { std::ignore = ComponentRegistry::newComponent(-1.0); }));
        expect(throws<InvalidUncertaintyError>([] { std::ignore = ComponentRegistry::newComponent(std::numeric_limits<double>::infinity()); }));
        expect(throws<InvalidUncertaintyError>([] { std::ignore = ComponentRegistry::newComponent(std::numeric_limits<double>::quiet_NaN()); }));
        expect(throws<InvalidUncertaintyError>([] { std::ignore = ComponentRegistry::fromStandardUncertainty(-0.5); }));
    };

    "allocated count is monotonic"_test = [] {
        const auto before = ComponentRegistry::allocatedCount();
        std::ignore       = ComponentRegistry::newComponent(1.0);
        std::ignore       = ComponentRegistry::newComponent(1.0);
        expect(ge(ComponentRegistry::allocatedCount(), before + 2UZ));
    };

    "concurrent allocation yields unique ids"_test = [] {
        constexpr std::size_t                 nThreads   = 4UZ;
        constexpr std::size_t                 nPerThread = 1000UZ;
        std::vector<std::vector<ComponentId>> ids(nThreads);
        {
            std::vector<std::jthread> threads;
            for (std::size_t t = 0UZ; t < nThreads; ++t) {
                threads.emplace_back([&ids, t] {
                    for (std::size_t i = 0UZ; i < nPerThread; ++i) {
                        ids[t].push_back(ComponentRegistry::newComponent(1.0).id());
                    }
                });
            }
        }
        std::unordered_set<ComponentId> unique;
        for (const auto& perThread : ids) {
            unique.insert(perThread.begin(), perThread.end());
        }
        expect(eq(unique.size(), nThreads * nPerThread));
    };
};

} // namespace scuq::test

int main() { /* tests are statically executed */ }
