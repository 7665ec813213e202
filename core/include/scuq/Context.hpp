#ifndef SCUQ_CONTEXT_HPP
#define SCUQ_CONTEXT_HPP

#include <cmath>
#include <cstddef>
#include <map>
#include <source_location>
#include <utility>

#include <scuq/Component.hpp>
#include <scuq/Exception.hpp>
#include <scuq/UncertainValue.hpp>
#include <scuq/meta/utils.hpp>

namespace scuq {

template<meta::UncertaintyScalar T>
class Quantity;

/**
 * @brief evaluates uncertainties under optional correlations between input Components
 *
 * Components are independent by construction. When two inputs are known to be correlated (e.g. two readings of the
 * same calibrated instrument) the correlation coefficient r_ij is registered here and the evaluation becomes
 *   cov(x, y) = sum_i sum_j c_i conj(d_j) r_ij u_i u_j
 * with r_ii = 1 and r_ij = 0 for unregistered pairs. An empty Context reproduces UncertainValue::variance/covariance.
 *
 * A Context is a mutable configuration object; the values it evaluates are not modified.
 */
class Context {
    struct Correlation {
        Component first;
        Component second;
        double    coefficient;
    };

    std::map<std::pair<ComponentId, ComponentId>, Correlation> _correlations; // key ordered (min id, max id)

    template<meta::UncertaintyScalar T>
    [[nodiscard]] T crossTerms(const SensitivityMap<T>& lhs, const SensitivityMap<T>& rhs) const {
        using real_type = meta::fundamental_base_value_type_t<T>;
        T sum{0};
        for (const auto& [key, entry] : _correlations) {
            const auto weight = static_cast<real_type>(entry.coefficient * entry.first.standardUncertainty() * entry.second.standardUncertainty());
            sum += (lhs.coefficient(entry.first) * meta::conj(rhs.coefficient(entry.second)) + lhs.coefficient(entry.second) * meta::conj(rhs.coefficient(entry.first))) * weight;
        }
        return sum;
    }

public:
    /// registers r(a, b) = r(b, a) = coefficient; r must lie in [-1, 1] and a component is always fully self-correlated
    void setCorrelation(const Component& a, const Component& b, double coefficient, std::source_location location = std::source_location::current());

    /// 1 for identical components, the registered coefficient otherwise, 0 if none was registered
    [[nodiscard]] double correlation(const Component& a, const Component& b) const noexcept;

    void clearCorrelations() noexcept { _correlations.clear(); }

    [[nodiscard]] std::size_t correlationCount() const noexcept { return _correlations.size(); }

    template<meta::UncertaintyScalar T>
    [[nodiscard]] T covariance(const UncertainValue<T>& x, const UncertainValue<T>& y) const {
        return x.sensitivities().covariance(y.sensitivities()) + crossTerms(x.sensitivities(), y.sensitivities());
    }

    template<meta::UncertaintyScalar T>
    [[nodiscard]] meta::fundamental_base_value_type_t<T> variance(const UncertainValue<T>& x) const {
        using real_type = meta::fundamental_base_value_type_t<T>;
        // correlated inputs may drive a rounding-level negative sum for perfectly anti-correlated combinations
        const real_type value = meta::realPart(covariance(x, x));
        return value > real_type(0) ? value : real_type(0);
    }

    template<meta::UncertaintyScalar T>
    [[nodiscard]] meta::fundamental_base_value_type_t<T> standardUncertainty(const UncertainValue<T>& x) const {
        return std::sqrt(variance(x));
    }

    /// coverage factor k times the standard uncertainty, e.g. k = 2 for ~95% coverage of a normal distribution
    template<meta::UncertaintyScalar T>
    [[nodiscard]] meta::fundamental_base_value_type_t<T> expandedUncertainty(const UncertainValue<T>& x, double coverageFactor, std::source_location location = std::source_location::current()) const {
        using real_type = meta::fundamental_base_value_type_t<T>;
        if (!std::isfinite(coverageFactor) || coverageFactor < 0.0) [[unlikely]] {
            throw InvalidUncertaintyError("coverage factor must be finite and >= 0", location);
        }
        return static_cast<real_type>(coverageFactor) * standardUncertainty(x);
    }

    /// standard uncertainty as a certain quantity in the unit of q (defined in Quantity.hpp)
    template<meta::UncertaintyScalar T>
    [[nodiscard]] Quantity<meta::fundamental_base_value_type_t<T>> uncertainty(const Quantity<T>& q) const;

    template<meta::UncertaintyScalar T>
    [[nodiscard]] T covariance(const Quantity<T>& x, const Quantity<T>& y) const;
};

} // namespace scuq

#endif // SCUQ_CONTEXT_HPP
