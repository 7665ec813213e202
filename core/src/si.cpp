#include <scuq/si.hpp>

#include <algorithm>

namespace scuq::si {

const std::vector<Prefix>& prefixes() {
    static const std::vector<Prefix> table{
        {"quecto", "q", quecto}, {"ronto", "r", ronto}, {"yocto", "y", yocto}, {"zepto", "z", zepto}, {"atto", "a", atto}, {"femto", "f", femto}, {"pico", "p", pico}, {"nano", "n", nano}, {"micro", "µ", micro}, {"milli", "m", milli}, {"centi", "c", centi}, {"deci", "d", deci}, //
        {"deca", "da", deca}, {"hecto", "h", hecto}, {"kilo", "k", kilo}, {"mega", "M", mega}, {"giga", "G", giga}, {"tera", "T", tera}, {"peta", "P", peta}, {"exa", "E", exa}, {"zetta", "Z", zetta}, {"yotta", "Y", yotta}, {"ronna", "R", ronna}, {"quetta", "Q", quetta},
    };
    return table;
}

bool UnitTable::add(std::string symbol, const Unit& unit) {
    if (_bySymbol.contains(symbol)) {
        return false;
    }
    _bySymbol.emplace(symbol, _entries.size());
    _entries.emplace_back(std::move(symbol), unit);
    return true;
}

std::optional<Unit> UnitTable::find(std::string_view symbol) const {
    if (const auto it = _bySymbol.find(symbol); it != _bySymbol.cend()) {
        return _entries[it->second].second;
    }
    return std::nullopt;
}

std::optional<std::string_view> UnitTable::symbolOf(const Unit& unit) const {
    const auto it = std::ranges::find(_entries, unit, &std::pair<std::string, Unit>::second);
    if (it == _entries.cend()) {
        return std::nullopt;
    }
    return std::string_view{it->first};
}

namespace {

UnitTable buildUnitTable() {
    UnitTable table;
    table.add("1", one);

    // prefixable units in preferred display order; the kilogram is prefixed through the gram
    const std::vector<std::pair<std::string_view, Unit>> prefixable{
        {"m", metre}, {"kg", kilogram}, {"s", second}, {"A", ampere}, {"K", kelvin}, {"mol", mole}, {"cd", candela},                                       //
        {"Hz", hertz}, {"N", newton}, {"Pa", pascal}, {"J", joule}, {"W", watt}, {"C", coulomb}, {"V", volt}, {"F", farad}, {"Ω", ohm}, {"S", siemens}, //
        {"Wb", weber}, {"T", tesla}, {"H", henry}, {"g", gram},
    };
    for (const auto& [symbol, unit] : prefixable) {
        table.add(std::string{symbol}, unit);
    }
    table.add("rad", radian);
    table.add("sr", steradian);
    table.add("Bq", hertz);
    table.add("min", minute);
    table.add("h", hour);
    table.add("L", litre);
    table.add("%", percent);
    table.add("°", degree);

    for (const auto& [symbol, unit] : prefixable) {
        if (symbol == "kg") {
            continue;
        }
        for (const auto& prefix : prefixes()) {
            table.add(std::string{prefix.symbol} + std::string{symbol}, unit.scaled(prefix.factor));
        }
    }
    return table;
}

} // namespace

const UnitTable& units() {
    static const UnitTable table = buildUnitTable();
    return table;
}

} // namespace scuq::si
