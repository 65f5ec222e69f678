#include <pbk/units.hpp>

#include <string>

#include <fmt/format.h>

std::optional<Length> ParseLength(std::string_view str)
{
    const auto separator{ str.find(' ') };
    if (separator == std::string_view::npos)
    {
        return std::nullopt;
    }

    const auto unit{ UnitFromName(str.substr(separator + 1)) };
    if (!unit.has_value())
    {
        return std::nullopt;
    }

    const auto value{ ParseFloat(str.substr(0, separator)) };
    if (!value.has_value())
    {
        return std::nullopt;
    }

    return value.value() * UnitValue(unit.value());
}

std::string FormatLength(Length length, Unit unit)
{
    return fmt::format("{} {}", static_cast<float>(length / UnitValue(unit)), UnitShortName(unit));
}
