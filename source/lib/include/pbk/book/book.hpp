#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include <pbk/book/image_provider.hpp>
#include <pbk/config.hpp>
#include <pbk/layout/image_info.hpp>
#include <pbk/layout/image_order.hpp>
#include <pbk/layout/page_geometry.hpp>
#include <pbk/layout/page_layout.hpp>
#include <pbk/units.hpp>
#include <pbk/util.hpp>

struct BookSettings
{
    fs::path m_ImageDir{ "images"_p };
    fs::path m_OutputDir{ "output"_p };
    std::string m_DocumentName{ "picture-book" };

    PageSizeClass m_PageSize{ PageSizeClass::Letter };
    PageOrientation m_Orientation{ PageOrientation::Portrait };
    float m_ScalingFactor{ 1.0f };
    Length m_Spacing{ 0.3_in };
    PagingStrategy m_Paging{ c_GreedyPaging };
    ImageOrder m_ImageOrder{ ImageOrder::LastModified };
    ImageOrderDirection m_ImageOrderDirection{ ImageOrderDirection::Ascending };
    PixelDensity m_BaseDensity{ c_BaseDensity };

    bool m_Captions{ true };
    uint32_t m_CaptionFontSize{ 8 };

    DocumentFormat m_DocumentFormat{ DocumentFormat::Latex };
    Unit m_Unit{ Unit::Inches };
    bool m_CompilePdf{ true };
};

BookSettings DefaultBookSettings(const Config& config);

// Keys that are not present are left untouched, invalid values throw ConfigurationError
void LoadBookSettings(BookSettings& settings, const nlohmann::json& json);
nlohmann::json DumpBookSettings(const BookSettings& settings);

bool IsBookSettingKey(std::string_view key);

void ValidateBookSettings(const BookSettings& settings);

struct BookLayout
{
    PageGeometry m_Geometry;
    Length m_Spacing;
    std::vector<Page> m_Pages;
    std::vector<SkippedImage> m_Skipped;
};

// Reads all images from the settings' image directory
BookLayout BuildBookLayout(const BookSettings& settings);
BookLayout BuildBookLayout(const BookSettings& settings, std::vector<ImageInfo> images);
