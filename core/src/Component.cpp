#include <scuq/Component.hpp>
#include <scuq/Exception.hpp>

#include <cmath>

#include <fmt/format.h>

namespace scuq {

std::atomic<ComponentId> ComponentRegistry::_nextId{1UZ};

double Component::standardUncertainty() const noexcept { return std::sqrt(_variance); }

Component ComponentRegistry::newComponent(double variance, std::source_location location) {
    if (!std::isfinite(variance) || variance < 0.0) [[unlikely]] {
        throw InvalidUncertaintyError(fmt::format("invalid variance {} (must be finite and >= 0)", variance), location);
    }
    return Component{_nextId.fetch_add(1UZ, std::memory_order_relaxed), variance};
}

Component ComponentRegistry::fromStandardUncertainty(double standardUncertainty, std::source_location location) {
    if (!std::isfinite(standardUncertainty) || standardUncertainty < 0.0) [[unlikely]] {
        throw InvalidUncertaintyError(fmt::format("invalid standard uncertainty {} (must be finite and >= 0)", standardUncertainty), location);
    }
    return newComponent(standardUncertainty * standardUncertainty, location);
}

std::uint64_t ComponentRegistry::allocatedCount() noexcept { return _nextId.load(std::memory_order_relaxed) - 1UZ; }

} // namespace scuq
