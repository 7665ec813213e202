#ifndef SCUQ_META_UTILS_HPP
#define SCUQ_META_UTILS_HPP

#include <complex>
#include <concepts>
#include <cstddef>
#include <type_traits>
#include <vector>

namespace scuq::meta {

template<template<typename...> class Template, typename Class>
struct is_instantiation : std::false_type {};

template<template<typename...> class Template, typename... Args>
struct is_instantiation<Template, Template<Args...>> : std::true_type {};

template<typename Class, template<typename...> class Template>
concept is_instantiation_of = is_instantiation<Template, Class>::value;

template<typename T>
concept complex_like = std::is_same_v<T, std::complex<float>> || std::is_same_v<T, std::complex<double>>;

namespace detail {

template<typename T>
concept HasValueType = requires { typename T::value_type; };

template<typename T, typename = void>
struct fundamental_base_value_type {
    using type = T;
};

template<HasValueType T>
struct fundamental_base_value_type<T> {
    using type = typename fundamental_base_value_type<typename T::value_type>::type;
};

} // namespace detail

template<typename T>
using fundamental_base_value_type_t = typename detail::fundamental_base_value_type<T>::type;

static_assert(std::is_same_v<fundamental_base_value_type_t<double>, double>);
static_assert(std::is_same_v<fundamental_base_value_type_t<std::complex<float>>, float>);
static_assert(std::is_same_v<fundamental_base_value_type_t<std::vector<std::complex<double>>>, double>);

/// value types an uncertain value may carry: real floating point or std::complex thereof
template<typename T>
concept UncertaintyScalar = std::floating_point<T> || complex_like<T>;

template<UncertaintyScalar T>
[[nodiscard]] constexpr T conj(const T& value) noexcept {
    if constexpr (complex_like<T>) {
        return std::conj(value);
    } else {
        return value;
    }
}

/// |value|^2 without the square-root round-trip of std::abs
template<UncertaintyScalar T>
[[nodiscard]] constexpr fundamental_base_value_type_t<T> abs2(const T& value) noexcept {
    if constexpr (complex_like<T>) {
        return value.real() * value.real() + value.imag() * value.imag();
    } else {
        return value * value;
    }
}

template<UncertaintyScalar T>
[[nodiscard]] constexpr fundamental_base_value_type_t<T> realPart(const T& value) noexcept {
    if constexpr (complex_like<T>) {
        return value.real();
    } else {
        return value;
    }
}

} // namespace scuq::meta

#endif // SCUQ_META_UTILS_HPP
