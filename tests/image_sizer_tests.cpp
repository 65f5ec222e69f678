#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <pbk/errors.hpp>
#include <pbk/layout/image_sizer.hpp>
#include <pbk/layout/page_geometry.hpp>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Nominal size uses the base density", "[image_sizer_nominal]")
{
    const Size nominal{ NominalSize(PixelSize{ 960_pix, 480_pix }) };
    REQUIRE_THAT(ToInches(nominal.x), WithinAbs(10.0f, 0.001f));
    REQUIRE_THAT(ToInches(nominal.y), WithinAbs(5.0f, 0.001f));

    const Size dense{ NominalSize(PixelSize{ 600_pix, 300_pix }, 300_dpi) };
    REQUIRE_THAT(ToInches(dense.x), WithinAbs(2.0f, 0.001f));
    REQUIRE_THAT(ToInches(dense.y), WithinAbs(1.0f, 0.001f));
}

TEST_CASE("Images that fit keep their scaled size", "[image_sizer_fit]")
{
    const Size usable{ 7.5_in, 10_in };
    const PrintSize print_size{ ResolveSize(PixelSize{ 384_pix, 192_pix }, usable, 0.5f) };
    REQUIRE_THAT(ToInches(print_size.m_Size.x), WithinAbs(2.0f, 0.001f));
    REQUIRE_THAT(ToInches(print_size.m_Size.y), WithinAbs(1.0f, 0.001f));
    REQUIRE_THAT(print_size.m_Scale, WithinAbs(0.5f, 0.0001f));
}

TEST_CASE("Overflowing images are clamped with a safety factor", "[image_sizer_overflow]")
{
    const Size usable{ 7.5_in, 10_in };

    // 20in x 10in nominal, width is the tighter constraint
    const PrintSize wide{ ResolveSize(PixelSize{ 1920_pix, 960_pix }, usable, 1.0f) };
    REQUIRE_THAT(ToInches(wide.m_Size.x), WithinAbs(7.5f * 0.95f, 0.001f));
    REQUIRE_THAT(ToInches(wide.m_Size.y), WithinAbs(7.5f * 0.95f / 2.0f, 0.001f));
    REQUIRE_THAT(wide.m_Scale, WithinRel(7.5f / 20.0f * 0.95f, 0.001f));

    // 5in x 20in nominal, height is the tighter constraint
    const PrintSize tall{ ResolveSize(PixelSize{ 480_pix, 1920_pix }, usable, 1.0f) };
    REQUIRE_THAT(ToInches(tall.m_Size.y), WithinAbs(10.0f * 0.95f, 0.001f));
    REQUIRE_THAT(ToInches(tall.m_Size.x), WithinAbs(10.0f * 0.95f / 4.0f, 0.001f));
}

TEST_CASE("Resolved sizes never exceed the usable area", "[image_sizer_bounds]")
{
    const PageGeometry geometry{ ComputeUsablePage(PageSizeClass::A4, PageOrientation::Portrait) };
    const PixelSize pixel_sizes[]{
        { 1_pix, 1_pix },
        { 4000_pix, 3000_pix },
        { 3000_pix, 4000_pix },
        { 10000_pix, 20_pix },
        { 20_pix, 10000_pix },
        { 720_pix, 1056_pix },
    };
    const float scaling_factors[]{ 0.1f, 0.25f, 0.5f, 0.75f, 1.0f };

    for (const PixelSize& pixel_size : pixel_sizes)
    {
        const float aspect_ratio{ static_cast<float>(pixel_size.x / pixel_size.y) };
        for (const float scaling_factor : scaling_factors)
        {
            const PrintSize print_size{ ResolveSize(pixel_size, geometry.m_UsableSize, scaling_factor) };
            REQUIRE(print_size.m_Size.x <= geometry.m_UsableSize.x);
            REQUIRE(print_size.m_Size.y <= geometry.m_UsableSize.y);
            REQUIRE(print_size.m_Scale <= scaling_factor);

            const float resolved_ratio{ static_cast<float>(print_size.m_Size.x / print_size.m_Size.y) };
            REQUIRE_THAT(resolved_ratio, WithinRel(aspect_ratio, 0.001f));
        }
    }
}

TEST_CASE("Degenerate pixel sizes are rejected", "[image_sizer_invalid]")
{
    const Size usable{ 7.5_in, 10_in };
    REQUIRE_THROWS_AS(ResolveSize(PixelSize{ 0_pix, 100_pix }, usable, 1.0f), InvalidImageDimensions);
    REQUIRE_THROWS_AS(ResolveSize(PixelSize{ 100_pix, 0_pix }, usable, 1.0f), InvalidImageDimensions);
    REQUIRE_THROWS_AS(ResolveSize(PixelSize{ Pixel{ -5.0f }, 100_pix }, usable, 1.0f), InvalidImageDimensions);
}

TEST_CASE("Scaling factor range", "[image_sizer_scaling]")
{
    REQUIRE(IsValidScalingFactor(0.1f));
    REQUIRE(IsValidScalingFactor(0.7f));
    REQUIRE(IsValidScalingFactor(1.0f));
    REQUIRE_FALSE(IsValidScalingFactor(0.05f));
    REQUIRE_FALSE(IsValidScalingFactor(1.5f));
    REQUIRE_FALSE(IsValidScalingFactor(0.0f));
}
