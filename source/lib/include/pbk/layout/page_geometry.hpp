#pragma once

#include <string_view>

#include <pbk/util.hpp>

enum class PageSizeClass
{
    Letter,
    A4,
    Legal,
};

enum class PageOrientation
{
    Portrait,
    Landscape,
};

inline constexpr Length c_PageMargin{ 0.5_in };

struct PageGeometry
{
    PageSizeClass m_PageSizeClass;
    PageOrientation m_Orientation;

    // Page size after orientation is applied
    Size m_PageSize;
    Length m_Margin;

    // Page size with the margin removed on every side
    Size m_UsableSize;
};

// Portrait dimensions of a page-size class
Size RawPageSize(PageSizeClass page_size);

PageGeometry ComputeUsablePage(PageSizeClass page_size, PageOrientation orientation);

// Both are case-insensitive and throw ConfigurationError for unknown names
PageSizeClass PageSizeClassFromName(std::string_view name);
PageOrientation PageOrientationFromName(std::string_view name);

std::string_view PageSizeClassName(PageSizeClass page_size);
std::string_view PageOrientationName(PageOrientation orientation);
