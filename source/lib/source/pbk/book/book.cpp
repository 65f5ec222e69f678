#include <pbk/book/book.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <string>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <nlohmann/json.hpp>

#include <pbk/errors.hpp>
#include <pbk/json_util.hpp>
#include <pbk/layout/image_sizer.hpp>
#include <pbk/util/log.hpp>
#include <pbk/version.hpp>

// Order matters, the unit has to be known before the spacing is read
inline constexpr std::array c_BookSettingKeys{
    std::string_view{ "image_dir" },
    std::string_view{ "output_dir" },
    std::string_view{ "document_name" },
    std::string_view{ "page_size" },
    std::string_view{ "orientation" },
    std::string_view{ "scaling" },
    std::string_view{ "unit" },
    std::string_view{ "spacing" },
    std::string_view{ "images_per_page" },
    std::string_view{ "order" },
    std::string_view{ "order_direction" },
    std::string_view{ "base_dpi" },
    std::string_view{ "captions" },
    std::string_view{ "caption_font_size" },
    std::string_view{ "format" },
    std::string_view{ "compile_pdf" },
};

static std::string GetString(const nlohmann::json& json, std::string_view key)
{
    const nlohmann::json& value{ GetJsonValue(json, key) };
    if (value.is_string())
    {
        return value.get<std::string>();
    }
    if (value.is_number() || value.is_boolean())
    {
        return value.dump();
    }

    throw ConfigurationError{
        fmt::format("Setting {} expects a string, got {}", key, value.dump())
    };
}

static float GetFloat(const nlohmann::json& json, std::string_view key)
{
    const nlohmann::json& value{ GetJsonValue(json, key) };
    if (value.is_number())
    {
        return value.get<float>();
    }
    if (value.is_string())
    {
        if (const auto float_value{ ParseFloat(value.get<std::string>()) })
        {
            return float_value.value();
        }
    }

    throw ConfigurationError{
        fmt::format("Setting {} expects a number, got {}", key, value.dump())
    };
}

static uint32_t GetUInt(const nlohmann::json& json, std::string_view key)
{
    const nlohmann::json& value{ GetJsonValue(json, key) };
    if (value.is_number_unsigned())
    {
        return value.get<uint32_t>();
    }
    if (value.is_string())
    {
        const std::string str{ value.get<std::string>() };
        uint32_t uint_value{};
        const auto [ptr, error]{ std::from_chars(str.data(), str.data() + str.size(), uint_value) };
        if (error == std::errc{} && ptr == str.data() + str.size())
        {
            return uint_value;
        }
    }

    throw ConfigurationError{
        fmt::format("Setting {} expects a non-negative integer, got {}", key, value.dump())
    };
}

static bool GetBool(const nlohmann::json& json, std::string_view key)
{
    const nlohmann::json& value{ GetJsonValue(json, key) };
    if (value.is_boolean())
    {
        return value.get<bool>();
    }
    if (value.is_string())
    {
        const std::string str{ ToLower(value.get<std::string>()) };
        if (str == "true" || str == "yes" || str == "on" || str == "1")
        {
            return true;
        }
        if (str == "false" || str == "no" || str == "off" || str == "0")
        {
            return false;
        }
    }

    throw ConfigurationError{
        fmt::format("Setting {} expects a boolean, got {}", key, value.dump())
    };
}

template<class EnumT>
static EnumT GetEnum(const nlohmann::json& json, std::string_view key)
{
    const std::string name{ GetString(json, key) };
    const auto enum_value{ magic_enum::enum_cast<EnumT>(name, magic_enum::case_insensitive) };
    if (!enum_value.has_value())
    {
        throw ConfigurationError{
            fmt::format("Unknown value '{}' for setting {}", name, key)
        };
    }
    return enum_value.value();
}

BookSettings DefaultBookSettings(const Config& config)
{
    return BookSettings{
        .m_PageSize = config.m_PageSize,
        .m_Orientation = config.m_Orientation,
        .m_ScalingFactor = config.m_ScalingFactor,
        .m_Spacing = config.m_Spacing,
        .m_Paging = config.m_ImagesPerPage == 0 ? c_GreedyPaging
                                                : FixedCountPaging(config.m_ImagesPerPage),
        .m_ImageOrder = config.m_ImageOrder,
        .m_ImageOrderDirection = config.m_ImageOrderDirection,
        .m_BaseDensity = config.m_BaseDensity,
        .m_Captions = config.m_Captions,
        .m_CaptionFontSize = config.m_CaptionFontSize,
        .m_DocumentFormat = config.m_DocumentFormat,
        .m_Unit = config.m_BaseUnit,
    };
}

void LoadBookSettings(BookSettings& settings, const nlohmann::json& json)
{
    if (!json.is_object())
    {
        throw ConfigurationError{ "Book settings have to be a json object" };
    }

    if (HasJsonValue(json, "version"))
    {
        const std::string version{ GetString(json, "version") };
        if (version != SettingsFormatVersion())
        {
            LogWarning("Settings were written with format {}, expected {}", version, SettingsFormatVersion());
        }
    }

    for (const auto& item : json.items())
    {
        const std::string& key{ item.key() };
        if (key != "version" && !IsBookSettingKey(key))
        {
            LogWarning("Ignoring unknown setting {}", key);
        }
    }

    const auto has{
        [&json](std::string_view key)
        {
            return HasJsonValue(json, key);
        }
    };

    if (has("image_dir"))
    {
        settings.m_ImageDir = GetString(json, "image_dir");
    }
    if (has("output_dir"))
    {
        settings.m_OutputDir = GetString(json, "output_dir");
    }
    if (has("document_name"))
    {
        settings.m_DocumentName = GetString(json, "document_name");
    }
    if (has("page_size"))
    {
        settings.m_PageSize = PageSizeClassFromName(GetString(json, "page_size"));
    }
    if (has("orientation"))
    {
        settings.m_Orientation = PageOrientationFromName(GetString(json, "orientation"));
    }
    if (has("scaling"))
    {
        settings.m_ScalingFactor = GetFloat(json, "scaling");
    }
    if (has("unit"))
    {
        const std::string unit_name{ GetString(json, "unit") };
        const auto unit{ UnitFromName(unit_name) };
        if (!unit.has_value())
        {
            throw ConfigurationError{
                fmt::format("Unknown unit '{}', expected one of mm, cm, in or pts", unit_name)
            };
        }
        settings.m_Unit = unit.value();
    }
    if (has("spacing"))
    {
        const nlohmann::json& spacing{ GetJsonValue(json, "spacing") };
        if (spacing.is_number())
        {
            settings.m_Spacing = spacing.get<float>() * UnitValue(settings.m_Unit);
        }
        else
        {
            const std::string spacing_str{ GetString(json, "spacing") };
            if (const auto length{ ParseLength(spacing_str) })
            {
                settings.m_Spacing = length.value();
            }
            else if (const auto value{ ParseFloat(spacing_str) })
            {
                settings.m_Spacing = value.value() * UnitValue(settings.m_Unit);
            }
            else
            {
                throw ConfigurationError{
                    fmt::format("Invalid spacing '{}', expected e.g. \"0.3 in\"", spacing_str)
                };
            }
        }
    }
    if (has("images_per_page"))
    {
        const uint32_t images_per_page{ GetUInt(json, "images_per_page") };
        settings.m_Paging = images_per_page == 0 ? c_GreedyPaging
                                                 : FixedCountPaging(images_per_page);
    }
    if (has("order"))
    {
        settings.m_ImageOrder = GetEnum<ImageOrder>(json, "order");
    }
    if (has("order_direction"))
    {
        settings.m_ImageOrderDirection = GetEnum<ImageOrderDirection>(json, "order_direction");
    }
    if (has("base_dpi"))
    {
        settings.m_BaseDensity = GetFloat(json, "base_dpi") * 1_dpi;
    }
    if (has("captions"))
    {
        settings.m_Captions = GetBool(json, "captions");
    }
    if (has("caption_font_size"))
    {
        settings.m_CaptionFontSize = GetUInt(json, "caption_font_size");
    }
    if (has("format"))
    {
        settings.m_DocumentFormat = GetEnum<DocumentFormat>(json, "format");
    }
    if (has("compile_pdf"))
    {
        settings.m_CompilePdf = GetBool(json, "compile_pdf");
    }
}

nlohmann::json DumpBookSettings(const BookSettings& settings)
{
    nlohmann::json json{ nlohmann::json::object() };
    SetJsonValue(json, "version", std::string{ SettingsFormatVersion() });
    SetJsonValue(json, "image_dir", settings.m_ImageDir.generic_string());
    SetJsonValue(json, "output_dir", settings.m_OutputDir.generic_string());
    SetJsonValue(json, "document_name", settings.m_DocumentName);
    SetJsonValue(json, "page_size", ToLower(PageSizeClassName(settings.m_PageSize)));
    SetJsonValue(json, "orientation", ToLower(PageOrientationName(settings.m_Orientation)));
    SetJsonValue(json, "scaling", settings.m_ScalingFactor);
    SetJsonValue(json, "unit", std::string{ UnitShortName(settings.m_Unit) });
    SetJsonValue(json, "spacing", FormatLength(settings.m_Spacing, settings.m_Unit));
    SetJsonValue(json,
                 "images_per_page",
                 settings.m_Paging.m_Policy == PagingPolicy::Greedy ? 0u : settings.m_Paging.m_ImagesPerPage);
    SetJsonValue(json, "order", std::string{ magic_enum::enum_name(settings.m_ImageOrder) });
    SetJsonValue(json, "order_direction", std::string{ magic_enum::enum_name(settings.m_ImageOrderDirection) });
    SetJsonValue(json, "base_dpi", static_cast<float>(settings.m_BaseDensity / 1_dpi));
    SetJsonValue(json, "captions", settings.m_Captions);
    SetJsonValue(json, "caption_font_size", settings.m_CaptionFontSize);
    SetJsonValue(json, "format", std::string{ magic_enum::enum_name(settings.m_DocumentFormat) });
    SetJsonValue(json, "compile_pdf", settings.m_CompilePdf);
    return json;
}

bool IsBookSettingKey(std::string_view key)
{
    return std::ranges::find(c_BookSettingKeys, key) != c_BookSettingKeys.end();
}

void ValidateBookSettings(const BookSettings& settings)
{
    if (!IsValidScalingFactor(settings.m_ScalingFactor))
    {
        throw ConfigurationError{
            fmt::format("Scaling factor {} is outside of [{}, {}]",
                        settings.m_ScalingFactor,
                        c_MinScalingFactor,
                        c_MaxScalingFactor)
        };
    }

    if (!std::isfinite(ToInches(settings.m_Spacing)) || settings.m_Spacing < 0_mm)
    {
        throw ConfigurationError{
            fmt::format("Spacing has to be a non-negative length, got {}", FormatLength(settings.m_Spacing, settings.m_Unit))
        };
    }

    const float base_dpi{ static_cast<float>(settings.m_BaseDensity / 1_dpi) };
    if (!std::isfinite(base_dpi) || base_dpi <= 0.0f)
    {
        throw ConfigurationError{
            fmt::format("Base dpi has to be positive, got {}", base_dpi)
        };
    }

    if (settings.m_DocumentName.empty())
    {
        throw ConfigurationError{ "Document name can not be empty" };
    }

    if (settings.m_Captions && settings.m_CaptionFontSize == 0)
    {
        throw ConfigurationError{ "Caption font size has to be positive" };
    }

    ValidatePagingStrategy(settings.m_Paging);
}

BookLayout BuildBookLayout(const BookSettings& settings)
{
    ValidateBookSettings(settings);

    std::vector<SkippedImage> unreadable;
    std::vector<ImageInfo> images{ ReadImageInfos(settings.m_ImageDir, unreadable) };

    BookLayout layout{ BuildBookLayout(settings, std::move(images)) };
    layout.m_Skipped.insert(layout.m_Skipped.begin(), unreadable.begin(), unreadable.end());
    return layout;
}

BookLayout BuildBookLayout(const BookSettings& settings, std::vector<ImageInfo> images)
{
    ValidateBookSettings(settings);

    const PageGeometry geometry{ ComputeUsablePage(settings.m_PageSize, settings.m_Orientation) };
    const Size slot_size{ ComputeSlotSize(geometry, settings.m_Spacing, settings.m_Paging) };

    const std::vector<ImageInfo> ordered_images{
        OrderImages(std::move(images), settings.m_ImageOrder, settings.m_ImageOrderDirection)
    };

    std::vector<PlacedImage> placed_images;
    placed_images.reserve(ordered_images.size());

    std::vector<SkippedImage> skipped;
    for (const ImageInfo& image : ordered_images)
    {
        try
        {
            const PrintSize print_size{
                ResolveSize(image.m_PixelSize, slot_size, settings.m_ScalingFactor, settings.m_BaseDensity)
            };
            placed_images.push_back(PlacedImage{
                .m_Name = image.m_Name,
                .m_Path = image.m_Path,
                .m_Size = print_size.m_Size,
                .m_Scale = print_size.m_Scale,
            });
        }
        catch (const InvalidImageDimensions& e)
        {
            LogWarning("Skipping {}: {}", image.m_Name.string(), e.what());
            skipped.push_back({ image.m_Name, e.what() });
        }
    }

    std::vector<Page> pages{
        LayoutPages(placed_images, geometry.m_UsableSize.y, settings.m_Spacing, settings.m_Paging)
    };
    LogInfo("Laid out {} images on {} {} pages", placed_images.size(), pages.size(), PageSizeClassName(settings.m_PageSize));

    return BookLayout{
        .m_Geometry = geometry,
        .m_Spacing = settings.m_Spacing,
        .m_Pages = std::move(pages),
        .m_Skipped = std::move(skipped),
    };
}
