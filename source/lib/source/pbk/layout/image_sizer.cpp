#include <pbk/layout/image_sizer.hpp>

#include <algorithm>

#include <fmt/format.h>

#include <pbk/errors.hpp>

Size NominalSize(PixelSize pixel_size, PixelDensity base_density)
{
    const float pixels_per_inch{ static_cast<float>(base_density / 1_dpi) };
    return Size{
        static_cast<float>(pixel_size.x / 1_pix) / pixels_per_inch * 1_in,
        static_cast<float>(pixel_size.y / 1_pix) / pixels_per_inch * 1_in,
    };
}

PrintSize ResolveSize(PixelSize pixel_size,
                      Size usable_size,
                      float scaling_factor,
                      PixelDensity base_density)
{
    if (pixel_size.x <= 0_pix || pixel_size.y <= 0_pix)
    {
        throw InvalidImageDimensions{
            fmt::format("Invalid image dimensions {}x{}",
                        static_cast<float>(pixel_size.x / 1_pix),
                        static_cast<float>(pixel_size.y / 1_pix)),
            pixel_size,
        };
    }

    const Size nominal_size{ NominalSize(pixel_size, base_density) };
    const Size scaled_size{
        nominal_size.x * scaling_factor,
        nominal_size.y * scaling_factor,
    };

    if (scaled_size.x <= usable_size.x && scaled_size.y <= usable_size.y)
    {
        return PrintSize{
            .m_Size = scaled_size,
            .m_Scale = scaling_factor,
        };
    }

    const float fit_factor{
        std::min(static_cast<float>(usable_size.x / scaled_size.x),
                 static_cast<float>(usable_size.y / scaled_size.y)) *
        c_OverflowSafetyFactor
    };
    return PrintSize{
        .m_Size{
            scaled_size.x * fit_factor,
            scaled_size.y * fit_factor,
        },
        .m_Scale = scaling_factor * fit_factor,
    };
}

bool IsValidScalingFactor(float scaling_factor)
{
    return scaling_factor >= c_MinScalingFactor && scaling_factor <= c_MaxScalingFactor;
}
