#include <pbk/units.hpp>

#include <array>
#include <cstddef>

struct UnitDescription
{
    Unit m_Unit;
    Length m_Value;
    std::string_view m_ShortName;
    std::string_view m_LongName;
};

// Indexed by Unit
inline constexpr std::array c_UnitDescriptions{
    UnitDescription{ Unit::Millimeter, 1_mm, "mm", "millimeters" },
    UnitDescription{ Unit::Centimeter, 1_cm, "cm", "centimeters" },
    UnitDescription{ Unit::Inches, 1_in, "in", "inches" },
    UnitDescription{ Unit::Points, 1_pts, "pts", "points" },
};

constexpr const UnitDescription& DescribeUnit(Unit unit)
{
    return c_UnitDescriptions[static_cast<size_t>(unit)];
}

constexpr Length UnitValue(Unit unit)
{
    return DescribeUnit(unit).m_Value;
}
constexpr std::string_view UnitShortName(Unit unit)
{
    return DescribeUnit(unit).m_ShortName;
}

constexpr std::optional<Unit> UnitFromName(std::string_view unit_name)
{
    for (const UnitDescription& description : c_UnitDescriptions)
    {
        if (description.m_ShortName == unit_name || description.m_LongName == unit_name)
        {
            return description.m_Unit;
        }
    }
    return std::nullopt;
}

static_assert(
    []()
    {
        for (size_t i = 0; i < c_UnitDescriptions.size(); i++)
        {
            if (static_cast<size_t>(c_UnitDescriptions[i].m_Unit) != i)
            {
                return false;
            }
        }
        return true;
    }(),
    "c_UnitDescriptions has to follow the order of Unit");
