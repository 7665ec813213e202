#ifndef SCUQ_META_UNITTESTHELPER_HPP
#define SCUQ_META_UNITTESTHELPER_HPP

#include <boost/ut.hpp>

#include <array>
#include <cstdlib>
#include <cstddef>

#include <scuq/meta/formatter.hpp>
#include <scuq/meta/utils.hpp>

namespace scuq::test {

/// element-wise approx that also accepts std::complex (both parts compared against epsilon)
template<class TLhs, class TRhs, class TEpsilon>
[[nodiscard]] constexpr auto approx(const TLhs& lhs, const TRhs& rhs, const TEpsilon& epsilon) {
    if constexpr (meta::complex_like<TLhs>) {
        return boost::ut::detail::and_{boost::ut::detail::approx_{lhs.real(), rhs.real(), epsilon}, boost::ut::detail::approx_{lhs.imag(), rhs.imag(), epsilon}};
    } else {
        return boost::ut::detail::approx_{lhs, rhs, epsilon};
    }
}

template<typename T, std::size_t N, std::size_t M>
[[nodiscard]] bool approxMatrix(const std::array<std::array<T, M>, N>& lhs, const std::array<std::array<T, M>, N>& rhs, T epsilon) {
    for (std::size_t i = 0UZ; i < N; ++i) {
        for (std::size_t j = 0UZ; j < M; ++j) {
            if (lhs[i][j] - rhs[i][j] > epsilon || rhs[i][j] - lhs[i][j] > epsilon) {
                return false;
            }
        }
    }
    return true;
}

/// enables the "visual" tagged printouts unless DISABLE_SENSITIVE_TESTS is set (e.g. on CI)
inline void enableVisualTests() {
    if (std::getenv("DISABLE_SENSITIVE_TESTS") == nullptr) {
        boost::ut::cfg<boost::ut::override> = {.tag = {"visual"}};
    }
}

} // namespace scuq::test

#endif // SCUQ_META_UNITTESTHELPER_HPP
