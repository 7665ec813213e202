#ifndef SCUQ_SI_HPP
#define SCUQ_SI_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <numbers>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <scuq/Unit.hpp>

namespace scuq::si {

// base units
inline constexpr Unit one      = Unit::dimensionless();
inline constexpr Unit metre    = Unit::base(Dimension::Length);
inline constexpr Unit meter    = metre;
inline constexpr Unit kilogram = Unit::base(Dimension::Mass);
inline constexpr Unit second   = Unit::base(Dimension::Time);
inline constexpr Unit ampere   = Unit::base(Dimension::Current);
inline constexpr Unit kelvin   = Unit::base(Dimension::Temperature);
inline constexpr Unit mole     = Unit::base(Dimension::Amount);
inline constexpr Unit candela  = Unit::base(Dimension::LuminousIntensity);

// dimensionless derived units
inline constexpr Unit radian    = one;
inline constexpr Unit steradian = one;

// coherent derived units
inline constexpr Unit hertz   = one / second;
inline constexpr Unit newton  = kilogram * metre / (second * second);
inline constexpr Unit pascal  = newton / (metre * metre);
inline constexpr Unit joule   = newton * metre;
inline constexpr Unit watt    = joule / second;
inline constexpr Unit coulomb = ampere * second;
inline constexpr Unit volt    = watt / ampere;
inline constexpr Unit farad   = coulomb / volt;
inline constexpr Unit ohm     = volt / ampere;
inline constexpr Unit siemens = ampere / volt;
inline constexpr Unit weber   = volt * second;
inline constexpr Unit tesla   = weber / (metre * metre);
inline constexpr Unit henry   = weber / ampere;

// decimal prefixes (scale factors)
inline constexpr double quecto = 1e-30;
inline constexpr double ronto  = 1e-27;
inline constexpr double yocto  = 1e-24;
inline constexpr double zepto  = 1e-21;
inline constexpr double atto   = 1e-18;
inline constexpr double femto  = 1e-15;
inline constexpr double pico   = 1e-12;
inline constexpr double nano   = 1e-9;
inline constexpr double micro  = 1e-6;
inline constexpr double milli  = 1e-3;
inline constexpr double centi  = 1e-2;
inline constexpr double deci   = 1e-1;
inline constexpr double deca   = 1e1;
inline constexpr double hecto  = 1e2;
inline constexpr double kilo   = 1e3;
inline constexpr double mega   = 1e6;
inline constexpr double giga   = 1e9;
inline constexpr double tera   = 1e12;
inline constexpr double peta   = 1e15;
inline constexpr double exa    = 1e18;
inline constexpr double zetta  = 1e21;
inline constexpr double yotta  = 1e24;
inline constexpr double ronna  = 1e27;
inline constexpr double quetta = 1e30;

// common non-coherent units
inline constexpr Unit gram       = kilogram.scaled(milli);
inline constexpr Unit kilometre  = metre.scaled(kilo);
inline constexpr Unit millimetre = metre.scaled(milli);
inline constexpr Unit minute     = second.scaled(60.0);
inline constexpr Unit hour       = second.scaled(3600.0);
inline constexpr Unit litre      = (metre * metre * metre).scaled(milli);
inline constexpr Unit percent    = one.scaled(centi);
inline constexpr Unit degree     = radian.scaled(std::numbers::pi / 180.0);

struct Prefix {
    std::string_view name;
    std::string_view symbol;
    double           factor;
};

/// quecto (q, 1e-30) ... quetta (Q, 1e30), excluding the empty prefix
[[nodiscard]] const std::vector<Prefix>& prefixes();

/**
 * @brief symbol -> Unit table used for lookup and display
 *
 * The process-wide SI catalogue returned by units() is built once on first use and never modified afterwards, hence
 * safe to share between threads. Callers name their own units in a copy of it (or in an empty table) and format with
 * scuq::withSymbols(unit, table).
 * Symbols are unique; the first registered symbol of a unit is its preferred display symbol (e.g. "Hz" rather than "Bq").
 */
class UnitTable {
    std::vector<std::pair<std::string, Unit>>       _entries; // registration order defines symbol preference
    std::map<std::string, std::size_t, std::less<>> _bySymbol;

public:
    /// registers symbol unless it is already taken; returns true if it was added
    bool add(std::string symbol, const Unit& unit);

    [[nodiscard]] std::optional<Unit>             find(std::string_view symbol) const;
    [[nodiscard]] std::optional<std::string_view> symbolOf(const Unit& unit) const;
    [[nodiscard]] bool                            contains(std::string_view symbol) const { return _bySymbol.contains(symbol); }
    [[nodiscard]] std::size_t                     size() const noexcept { return _entries.size(); }
    [[nodiscard]] auto                            begin() const noexcept { return _entries.cbegin(); }
    [[nodiscard]] auto                            end() const noexcept { return _entries.cend(); }
};

/// the process-wide SI catalogue
[[nodiscard]] const UnitTable& units();

} // namespace scuq::si

#endif // SCUQ_SI_HPP
