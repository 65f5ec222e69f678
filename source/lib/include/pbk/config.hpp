#pragma once

#include <cstdint>
#include <string>

#include <pbk/layout/image_order.hpp>
#include <pbk/layout/image_sizer.hpp>
#include <pbk/layout/page_geometry.hpp>
#include <pbk/units.hpp>
#include <pbk/util.hpp>

enum class DocumentFormat
{
    Latex,
    Json,
    Pdf,
};

struct Config
{
    PixelDensity m_BaseDensity{ c_BaseDensity };
    PageSizeClass m_PageSize{ PageSizeClass::Letter };
    PageOrientation m_Orientation{ PageOrientation::Portrait };
    float m_ScalingFactor{ 1.0f };
    Length m_Spacing{ 0.3_in };

    // Zero means as many images per page as fit
    uint32_t m_ImagesPerPage{ 0 };

    ImageOrder m_ImageOrder{ ImageOrder::LastModified };
    ImageOrderDirection m_ImageOrderDirection{ ImageOrderDirection::Ascending };
    bool m_Captions{ true };
    uint32_t m_CaptionFontSize{ 8 };
    DocumentFormat m_DocumentFormat{ DocumentFormat::Latex };
    Unit m_BaseUnit{ Unit::Inches };
    std::string m_LatexBinary{ "pdflatex" };
    uint32_t m_LatexRuns{ 2 };
};

inline const fs::path c_DefaultConfigPath{ "config.ini" };

// A missing file yields the default config, invalid values throw ConfigurationError
Config LoadConfig(const fs::path& config_path = c_DefaultConfigPath);
void SaveConfig(const Config& config, const fs::path& config_path = c_DefaultConfigPath);
