#pragma once

#include <optional>
#include <string_view>

#include <pbk/util.hpp>

enum class Unit
{
    Millimeter,
    Centimeter,
    Inches,
    Points,
};

constexpr Length UnitValue(Unit unit);
constexpr std::string_view UnitShortName(Unit unit);

// Accepts both the long and the short name, e.g. "inches" and "in"
constexpr std::optional<Unit> UnitFromName(std::string_view unit_name);

// Parses lengths of the form "<value> <unit>", e.g. "0.3 in" or "7.5 mm"
std::optional<Length> ParseLength(std::string_view str);
std::string FormatLength(Length length, Unit unit);

#include <pbk/units.inl>
