#include <pbk/layout/page_geometry.hpp>

#include <utility>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <pbk/errors.hpp>

Size RawPageSize(PageSizeClass page_size)
{
    switch (page_size)
    {
    case PageSizeClass::Letter:
        return { 8.5_in, 11_in };
    case PageSizeClass::A4:
        return { 8.27_in, 11.69_in };
    case PageSizeClass::Legal:
        return { 8.5_in, 14_in };
    }

    throw ConfigurationError{
        fmt::format("Unknown page size class {}", static_cast<int>(page_size))
    };
}

PageGeometry ComputeUsablePage(PageSizeClass page_size, PageOrientation orientation)
{
    Size raw_size{ RawPageSize(page_size) };
    if (orientation == PageOrientation::Landscape)
    {
        std::swap(raw_size.x, raw_size.y);
    }

    return PageGeometry{
        .m_PageSizeClass = page_size,
        .m_Orientation = orientation,
        .m_PageSize = raw_size,
        .m_Margin = c_PageMargin,
        .m_UsableSize{
            raw_size.x - c_PageMargin * 2.0f,
            raw_size.y - c_PageMargin * 2.0f,
        },
    };
}

PageSizeClass PageSizeClassFromName(std::string_view name)
{
    const auto page_size{ magic_enum::enum_cast<PageSizeClass>(name, magic_enum::case_insensitive) };
    if (!page_size.has_value())
    {
        throw ConfigurationError{
            fmt::format("Unrecognized page size '{}', expected one of letter, a4 or legal", name)
        };
    }
    return page_size.value();
}

PageOrientation PageOrientationFromName(std::string_view name)
{
    const auto orientation{ magic_enum::enum_cast<PageOrientation>(name, magic_enum::case_insensitive) };
    if (!orientation.has_value())
    {
        throw ConfigurationError{
            fmt::format("Unrecognized orientation '{}', expected portrait or landscape", name)
        };
    }
    return orientation.value();
}

std::string_view PageSizeClassName(PageSizeClass page_size)
{
    return magic_enum::enum_name(page_size);
}

std::string_view PageOrientationName(PageOrientation orientation)
{
    return magic_enum::enum_name(orientation);
}
