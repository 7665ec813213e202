#include <scuq/Context.hpp>

#include <algorithm>

#include <fmt/format.h>

namespace scuq {

void Context::setCorrelation(const Component& a, const Component& b, double coefficient, std::source_location location) {
    if (!std::isfinite(coefficient) || coefficient < -1.0 || coefficient > 1.0) [[unlikely]] {
        throw InvalidUncertaintyError(fmt::format("correlation coefficient {} outside [-1, 1]", coefficient), location);
    }
    if (a == b) {
        if (coefficient != 1.0) [[unlikely]] {
            throw InvalidUncertaintyError(fmt::format("component {} must be fully correlated with itself, got {}", a.id(), coefficient), location);
        }
        return;
    }
    const auto& [first, second] = std::minmax(a, b);
    if (coefficient == 0.0) {
        _correlations.erase({first.id(), second.id()});
        return;
    }
    _correlations.insert_or_assign(std::pair{first.id(), second.id()}, Correlation{first, second, coefficient});
}

double Context::correlation(const Component& a, const Component& b) const noexcept {
    if (a == b) {
        return 1.0;
    }
    const auto& [first, second] = std::minmax(a, b);
    const auto it               = _correlations.find({first.id(), second.id()});
    return it != _correlations.cend() ? it->second.coefficient : 0.0;
}

} // namespace scuq
