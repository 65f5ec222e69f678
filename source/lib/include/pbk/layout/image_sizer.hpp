#pragma once

#include <pbk/util.hpp>

// Pixel density at which an image is considered to be at its nominal size
inline constexpr PixelDensity c_BaseDensity{ 96_dpi };

// Images that overflow the usable area are shrunk to this fraction of the tightest fit
inline constexpr float c_OverflowSafetyFactor{ 0.95f };

inline constexpr float c_MinScalingFactor{ 0.1f };
inline constexpr float c_MaxScalingFactor{ 1.0f };

struct PrintSize
{
    Size m_Size;

    // Total factor applied to the nominal size, including any overflow correction
    float m_Scale;
};

Size NominalSize(PixelSize pixel_size, PixelDensity base_density = c_BaseDensity);

/*
        Converts pixel dimensions into a printable size, scaled by scaling_factor and
        uniformly shrunk if it does not fit into usable_size. Aspect ratio is always preserved.
        Throws InvalidImageDimensions for empty or negative pixel sizes, the scaling factor
        is expected to be validated by the caller.
*/
PrintSize ResolveSize(PixelSize pixel_size,
                      Size usable_size,
                      float scaling_factor,
                      PixelDensity base_density = c_BaseDensity);

bool IsValidScalingFactor(float scaling_factor);
