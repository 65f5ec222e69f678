#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <magic_enum/magic_enum.hpp>

#include <pbk/errors.hpp>
#include <pbk/layout/page_geometry.hpp>

using Catch::Matchers::WithinAbs;

TEST_CASE("Usable page is raw page minus margins", "[page_geometry_usable]")
{
    for (const PageSizeClass page_size : magic_enum::enum_values<PageSizeClass>())
    {
        for (const PageOrientation orientation : magic_enum::enum_values<PageOrientation>())
        {
            const PageGeometry geometry{ ComputeUsablePage(page_size, orientation) };
            REQUIRE_THAT(ToInches(geometry.m_UsableSize.x), WithinAbs(ToInches(geometry.m_PageSize.x) - 1.0f, 0.001f));
            REQUIRE_THAT(ToInches(geometry.m_UsableSize.y), WithinAbs(ToInches(geometry.m_PageSize.y) - 1.0f, 0.001f));
            REQUIRE(geometry.m_UsableSize.x > 0_mm);
            REQUIRE(geometry.m_UsableSize.y > 0_mm);
            REQUIRE(geometry.m_PageSizeClass == page_size);
            REQUIRE(geometry.m_Orientation == orientation);
        }
    }
}

TEST_CASE("Letter portrait page", "[page_geometry_letter]")
{
    const PageGeometry geometry{ ComputeUsablePage(PageSizeClass::Letter, PageOrientation::Portrait) };
    REQUIRE_THAT(ToInches(geometry.m_UsableSize.x), WithinAbs(7.5f, 0.001f));
    REQUIRE_THAT(ToInches(geometry.m_UsableSize.y), WithinAbs(10.0f, 0.001f));
    REQUIRE_THAT(ToInches(geometry.m_Margin), WithinAbs(0.5f, 0.001f));
}

TEST_CASE("Landscape swaps page dimensions", "[page_geometry_landscape]")
{
    const PageGeometry portrait{ ComputeUsablePage(PageSizeClass::Legal, PageOrientation::Portrait) };
    const PageGeometry landscape{ ComputeUsablePage(PageSizeClass::Legal, PageOrientation::Landscape) };
    REQUIRE_THAT(ToInches(landscape.m_PageSize.x), WithinAbs(14.0f, 0.001f));
    REQUIRE_THAT(ToInches(landscape.m_PageSize.y), WithinAbs(8.5f, 0.001f));
    REQUIRE_THAT(ToInches(landscape.m_UsableSize.x), WithinAbs(ToInches(portrait.m_UsableSize.y), 0.001f));
    REQUIRE_THAT(ToInches(landscape.m_UsableSize.y), WithinAbs(ToInches(portrait.m_UsableSize.x), 0.001f));

    const PageGeometry a4{ ComputeUsablePage(PageSizeClass::A4, PageOrientation::Landscape) };
    REQUIRE_THAT(ToInches(a4.m_UsableSize.x), WithinAbs(10.69f, 0.001f));
    REQUIRE_THAT(ToInches(a4.m_UsableSize.y), WithinAbs(7.27f, 0.001f));
}

TEST_CASE("Page names are parsed case-insensitively", "[page_geometry_names]")
{
    REQUIRE(PageSizeClassFromName("letter") == PageSizeClass::Letter);
    REQUIRE(PageSizeClassFromName("A4") == PageSizeClass::A4);
    REQUIRE(PageSizeClassFromName("LEGAL") == PageSizeClass::Legal);
    REQUIRE(PageOrientationFromName("portrait") == PageOrientation::Portrait);
    REQUIRE(PageOrientationFromName("Landscape") == PageOrientation::Landscape);
}

TEST_CASE("Unknown page names are rejected", "[page_geometry_unknown]")
{
    REQUIRE_THROWS_AS(PageSizeClassFromName("tabloid"), ConfigurationError);
    REQUIRE_THROWS_AS(PageSizeClassFromName(""), ConfigurationError);
    REQUIRE_THROWS_AS(PageOrientationFromName("sideways"), ConfigurationError);
}
