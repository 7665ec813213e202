#ifndef SCUQ_COMPONENT_HPP
#define SCUQ_COMPONENT_HPP

#include <atomic>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <source_location>

namespace scuq {

using ComponentId = std::uint64_t;

/**
 * @brief independent elementary source of uncertainty
 *
 * A Component is an opaque identity plus the variance of its zero-mean perturbation. Two components are the same
 * source only if their ids match; equal variances never imply correlation. Components are immutable and cheap to
 * copy, so every SensitivityMap keeps its own copies rather than references into a registry.
 */
class Component {
    ComponentId _id       = 0;
    double      _variance = 0.0;

    constexpr Component(ComponentId id, double variance) noexcept : _id(id), _variance(variance) {}

    friend class ComponentRegistry;

public:
    [[nodiscard]] constexpr ComponentId id() const noexcept { return _id; }
    [[nodiscard]] constexpr double      variance() const noexcept { return _variance; }
    [[nodiscard]] double                standardUncertainty() const noexcept;

    friend constexpr bool                 operator==(const Component& lhs, const Component& rhs) noexcept { return lhs._id == rhs._id; }
    friend constexpr std::strong_ordering operator<=>(const Component& lhs, const Component& rhs) noexcept { return lhs._id <=> rhs._id; }
};

/**
 * @brief allocates Components with process-wide unique ids
 *
 * The id counter is the only shared mutable state of the library and is atomic, so inputs may be created
 * concurrently from several threads.
 */
class ComponentRegistry {
    static std::atomic<ComponentId> _nextId;

public:
    /// throws InvalidUncertaintyError if variance is negative or not finite
    [[nodiscard]] static Component newComponent(double variance, std::source_location location = std::source_location::current());

    /// convenience: variance = standardUncertainty^2, throws InvalidUncertaintyError for negative or non-finite input
    [[nodiscard]] static Component fromStandardUncertainty(double standardUncertainty, std::source_location location = std::source_location::current());

    /// number of components handed out so far (monotonic, never decremented)
    [[nodiscard]] static std::uint64_t allocatedCount() noexcept;
};

} // namespace scuq

template<>
struct std::hash<scuq::Component> {
    std::size_t operator()(const scuq::Component& component) const noexcept { return std::hash<scuq::ComponentId>{}(component.id()); }
};

#endif // SCUQ_COMPONENT_HPP
