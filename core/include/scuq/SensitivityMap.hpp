#ifndef SCUQ_SENSITIVITYMAP_HPP
#define SCUQ_SENSITIVITYMAP_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

#include <scuq/Component.hpp>
#include <scuq/meta/utils.hpp>

namespace scuq {

template<meta::UncertaintyScalar T>
struct Sensitivity {
    Component component;
    T         coefficient;

    bool operator==(const Sensitivity&) const = default;
};

template<typename Fn>
concept VarianceLookup = std::is_invocable_r_v<double, Fn, const Component&>;

/**
 * @brief sparse mapping Component -> d(value)/d(component), the first-order 'GUM tree' leaf weights
 *
 * Terms are kept sorted by component id, which makes add/covariance a linear merge of both operands.
 * A missing component is equivalent to a zero coefficient; exact zeros produced by cancellation (e.g. x - x) are dropped,
 * so an empty map denotes a certain value. Maps are never modified once built: every operation returns a new map.
 *
 * For complex T the coefficient c_k = dRe/de_k + i dIm/de_k holds the sensitivities of both the real and the
 * imaginary part to the (real-valued) perturbation e_k, i.e. two real maps over the same component space.
 */
template<meta::UncertaintyScalar T>
class SensitivityMap {
public:
    using value_type = T;
    using real_type  = meta::fundamental_base_value_type_t<T>;
    using term_type  = Sensitivity<T>;

private:
    std::vector<term_type> _terms; // sorted by component id, no zero coefficients

    explicit SensitivityMap(std::vector<term_type>&& sortedTerms) noexcept : _terms(std::move(sortedTerms)) {}

    static constexpr auto defaultVariance = [](const Component& component) noexcept { return component.variance(); };

    template<typename Visitor>
    void forEachCommon(const SensitivityMap& other, Visitor&& visitor) const {
        auto lhs = _terms.cbegin();
        auto rhs = other._terms.cbegin();
        while (lhs != _terms.cend() && rhs != other._terms.cend()) {
            if (lhs->component < rhs->component) {
                ++lhs;
            } else if (rhs->component < lhs->component) {
                ++rhs;
            } else {
                visitor(lhs->component, lhs->coefficient, rhs->coefficient);
                ++lhs;
                ++rhs;
            }
        }
    }

public:
    SensitivityMap() = default;

    [[nodiscard]] static SensitivityMap fromComponent(const Component& component, T coefficient = T{1}) {
        if (coefficient == T{0}) {
            return {};
        }
        return SensitivityMap{std::vector<term_type>{term_type{component, coefficient}}};
    }

    /// builds a map from arbitrary (unsorted, possibly repeated) terms; repeated components are summed
    [[nodiscard]] static SensitivityMap fromTerms(std::vector<term_type> terms) {
        std::ranges::stable_sort(terms, std::less<>{}, &term_type::component);
        std::vector<term_type> merged;
        merged.reserve(terms.size());
        for (const auto& term : terms) {
            if (!merged.empty() && merged.back().component == term.component) {
                merged.back().coefficient += term.coefficient;
            } else {
                merged.push_back(term);
            }
        }
        std::erase_if(merged, [](const term_type& term) { return term.coefficient == T{0}; });
        return SensitivityMap{std::move(merged)};
    }

    /// lossless promotion of a real-valued map to a complex-valued one
    template<meta::UncertaintyScalar U>
    requires(!std::is_same_v<U, T> && std::is_convertible_v<U, T>)
    explicit(false) SensitivityMap(const SensitivityMap<U>& other) {
        _terms.reserve(other.size());
        for (const auto& [component, coefficient] : other) {
            _terms.push_back(term_type{component, static_cast<T>(coefficient)});
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return _terms.size(); }
    [[nodiscard]] bool        empty() const noexcept { return _terms.empty(); }
    [[nodiscard]] auto        begin() const noexcept { return _terms.cbegin(); }
    [[nodiscard]] auto        end() const noexcept { return _terms.cend(); }

    [[nodiscard]] bool contains(const Component& component) const noexcept { return std::ranges::binary_search(_terms, component, std::less<>{}, &term_type::component); }

    /// zero if the component does not contribute
    [[nodiscard]] T coefficient(const Component& component) const noexcept {
        const auto it = std::ranges::lower_bound(_terms, component, std::less<>{}, &term_type::component);
        return (it != _terms.cend() && it->component == component) ? it->coefficient : T{0};
    }

    [[nodiscard]] SensitivityMap scale(T factor) const {
        if (factor == T{0}) {
            return {};
        }
        std::vector<term_type> scaled;
        scaled.reserve(_terms.size());
        for (const auto& [component, coefficient] : _terms) {
            scaled.push_back(term_type{component, coefficient * factor});
        }
        std::erase_if(scaled, [](const term_type& term) { return term.coefficient == T{0}; }); // underflow
        return SensitivityMap{std::move(scaled)};
    }

    /**
     * @brief (selfWeight * this) + (otherWeight * other) in a single merge pass
     *
     * This is the primitive behind all propagation rules: sums use weights (1, 1), products (b, a), quotients (1/b, -a/b^2).
     */
    [[nodiscard]] SensitivityMap combine(T selfWeight, const SensitivityMap& other, T otherWeight) const {
        std::vector<term_type> result;
        result.reserve(_terms.size() + other._terms.size());
        auto       lhs    = _terms.cbegin();
        auto       rhs    = other._terms.cbegin();
        const auto append = [&result](const Component& component, T coefficient) {
            if (coefficient != T{0}) {
                result.push_back(term_type{component, coefficient});
            }
        };
        while (lhs != _terms.cend() || rhs != other._terms.cend()) {
            if (rhs == other._terms.cend() || (lhs != _terms.cend() && lhs->component < rhs->component)) {
                append(lhs->component, selfWeight * lhs->coefficient);
                ++lhs;
            } else if (lhs == _terms.cend() || rhs->component < lhs->component) {
                append(rhs->component, otherWeight * rhs->coefficient);
                ++rhs;
            } else {
                append(lhs->component, selfWeight * lhs->coefficient + otherWeight * rhs->coefficient);
                ++lhs;
                ++rhs;
            }
        }
        return SensitivityMap{std::move(result)};
    }

    [[nodiscard]] SensitivityMap add(const SensitivityMap& other) const { return combine(T{1}, other, T{1}); }

    /// applies fn(coefficient) -> U to every term, e.g. to project a complex map onto its real part
    template<meta::UncertaintyScalar U = T, typename Fn>
    [[nodiscard]] SensitivityMap<U> transform(Fn&& fn) const {
        std::vector<Sensitivity<U>> transformed;
        transformed.reserve(_terms.size());
        for (const auto& [component, coefficient] : _terms) {
            if (const U value = fn(coefficient); value != U{0}) {
                transformed.push_back(Sensitivity<U>{component, value});
            }
        }
        return SensitivityMap<U>::fromTerms(std::move(transformed));
    }

    /// sum_c |coef_c|^2 * lookup(c)
    template<VarianceLookup Lookup>
    [[nodiscard]] real_type variance(Lookup&& lookup) const {
        real_type sum{0};
        for (const auto& [component, coefficient] : _terms) {
            sum += meta::abs2(coefficient) * static_cast<real_type>(lookup(component));
        }
        return sum;
    }

    [[nodiscard]] real_type variance() const { return variance(defaultVariance); }

    /// sum over shared components of coef_c * conj(other.coef_c) * lookup(c) (Hermitian for complex T)
    template<VarianceLookup Lookup>
    [[nodiscard]] T covariance(const SensitivityMap& other, Lookup&& lookup) const {
        T sum{0};
        forEachCommon(other, [&sum, &lookup](const Component& component, const T& lhs, const T& rhs) { sum += lhs * meta::conj(rhs) * static_cast<real_type>(lookup(component)); });
        return sum;
    }

    [[nodiscard]] T covariance(const SensitivityMap& other) const { return covariance(other, defaultVariance); }

    /**
     * @brief 2x2 real covariance of (Re, Im) parts between this and other: [[Re.Re, Re.Im], [Im.Re, Im.Im]]
     *
     * For real T only the [0][0] entry is non-zero.
     */
    template<VarianceLookup Lookup>
    [[nodiscard]] std::array<std::array<real_type, 2UZ>, 2UZ> covarianceMatrix(const SensitivityMap& other, Lookup&& lookup) const {
        std::array<std::array<real_type, 2UZ>, 2UZ> matrix{};
        forEachCommon(other, [&matrix, &lookup](const Component& component, const T& lhs, const T& rhs) {
            const auto variance = static_cast<real_type>(lookup(component));
            if constexpr (meta::complex_like<T>) {
                matrix[0][0] += lhs.real() * rhs.real() * variance;
                matrix[0][1] += lhs.real() * rhs.imag() * variance;
                matrix[1][0] += lhs.imag() * rhs.real() * variance;
                matrix[1][1] += lhs.imag() * rhs.imag() * variance;
            } else {
                matrix[0][0] += lhs * rhs * variance;
            }
        });
        return matrix;
    }

    [[nodiscard]] std::array<std::array<real_type, 2UZ>, 2UZ> covarianceMatrix(const SensitivityMap& other) const { return covarianceMatrix(other, defaultVariance); }

    bool operator==(const SensitivityMap&) const = default;
};

} // namespace scuq

#endif // SCUQ_SENSITIVITYMAP_HPP
