#include <pbk/config.hpp>

#include <cmath>
#include <string>

#include <QFile>
#include <QSettings>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <pbk/errors.hpp>
#include <pbk/qt_util.hpp>
#include <pbk/util/log.hpp>

template<class EnumT>
static EnumT EnumFromSetting(const QSettings& settings, const char* key, EnumT default_value)
{
    const QVariant value{ settings.value(key) };
    if (!value.isValid())
    {
        return default_value;
    }

    const std::string name{ value.toString().toStdString() };
    const auto enum_value{ magic_enum::enum_cast<EnumT>(name, magic_enum::case_insensitive) };
    if (!enum_value.has_value())
    {
        throw ConfigurationError{
            fmt::format("Unknown value '{}' for config key {}", name, key)
        };
    }
    return enum_value.value();
}

static uint32_t UIntFromSetting(const QSettings& settings, const char* key, uint32_t default_value)
{
    const QVariant value{ settings.value(key) };
    if (!value.isValid())
    {
        return default_value;
    }

    bool ok{ false };
    const uint32_t uint_value{ value.toUInt(&ok) };
    if (!ok)
    {
        throw ConfigurationError{
            fmt::format("Config key {} expects a non-negative integer, got '{}'",
                        key,
                        value.toString().toStdString())
        };
    }
    return uint_value;
}

Config LoadConfig(const fs::path& config_path)
{
    Config config{};
    if (!QFile::exists(ToQString(config_path)))
    {
        LogInfo("No config at {}, using defaults...", config_path.string());
        return config;
    }

    QSettings settings(ToQString(config_path), QSettings::IniFormat);
    if (settings.status() != QSettings::Status::NoError)
    {
        throw ConfigurationError{
            fmt::format("Failed reading config {}", config_path.string())
        };
    }

    settings.beginGroup("DEFAULT");

    {
        const QVariant base_dpi{ settings.value("Base.DPI") };
        if (base_dpi.isValid())
        {
            bool ok{ false };
            const float dpi{ base_dpi.toFloat(&ok) };
            if (!ok || !std::isfinite(dpi) || dpi <= 0.0f)
            {
                throw ConfigurationError{
                    fmt::format("Invalid Base.DPI '{}' in config", base_dpi.toString().toStdString())
                };
            }
            config.m_BaseDensity = dpi * 1_dpi;
        }
    }

    {
        const QVariant page_size{ settings.value("Page.Size") };
        if (page_size.isValid())
        {
            config.m_PageSize = PageSizeClassFromName(page_size.toString().toStdString());
        }

        const QVariant orientation{ settings.value("Page.Orientation") };
        if (orientation.isValid())
        {
            config.m_Orientation = PageOrientationFromName(orientation.toString().toStdString());
        }
    }

    {
        const QVariant scaling{ settings.value("Scaling.Factor") };
        if (scaling.isValid())
        {
            bool ok{ false };
            config.m_ScalingFactor = scaling.toFloat(&ok);
            if (!ok || !IsValidScalingFactor(config.m_ScalingFactor))
            {
                throw ConfigurationError{
                    fmt::format("Scaling.Factor '{}' is outside of [{}, {}]",
                                scaling.toString().toStdString(),
                                c_MinScalingFactor,
                                c_MaxScalingFactor)
                };
            }
        }
    }

    {
        const QVariant spacing{ settings.value("Image.Spacing") };
        if (spacing.isValid())
        {
            const std::string spacing_str{ spacing.toString().toStdString() };
            const auto spacing_length{ ParseLength(spacing_str) };
            if (!spacing_length.has_value() || !std::isfinite(ToInches(spacing_length.value())) || spacing_length.value() < 0_mm)
            {
                throw ConfigurationError{
                    fmt::format("Invalid Image.Spacing '{}', expected e.g. \"0.3 in\"", spacing_str)
                };
            }
            config.m_Spacing = spacing_length.value();
        }
    }

    config.m_ImagesPerPage = UIntFromSetting(settings, "Images.Per.Page", config.m_ImagesPerPage);
    config.m_ImageOrder = EnumFromSetting(settings, "Image.Order", config.m_ImageOrder);
    config.m_ImageOrderDirection = EnumFromSetting(settings, "Image.Order.Direction", config.m_ImageOrderDirection);
    config.m_Captions = settings.value("Captions", config.m_Captions).toBool();
    config.m_CaptionFontSize = UIntFromSetting(settings, "Caption.Font.Size", config.m_CaptionFontSize);
    config.m_DocumentFormat = EnumFromSetting(settings, "Document.Format", config.m_DocumentFormat);

    {
        const QVariant base_unit{ settings.value("Base.Unit") };
        if (base_unit.isValid())
        {
            const std::string unit_name{ base_unit.toString().toStdString() };
            const auto unit{ UnitFromName(unit_name) };
            if (!unit.has_value())
            {
                throw ConfigurationError{
                    fmt::format("Unknown Base.Unit '{}' in config", unit_name)
                };
            }
            config.m_BaseUnit = unit.value();
        }
    }

    config.m_LatexBinary = settings.value("Latex.Binary", ToQString(config.m_LatexBinary)).toString().toStdString();
    config.m_LatexRuns = UIntFromSetting(settings, "Latex.Runs", config.m_LatexRuns);

    settings.endGroup();

    return config;
}

void SaveConfig(const Config& config, const fs::path& config_path)
{
    QSettings settings(ToQString(config_path), QSettings::IniFormat);
    if (settings.status() == QSettings::Status::NoError)
    {
        settings.beginGroup("DEFAULT");

        settings.setValue("Base.DPI", static_cast<float>(config.m_BaseDensity / 1_dpi));
        settings.setValue("Page.Size", ToQString(PageSizeClassName(config.m_PageSize)));
        settings.setValue("Page.Orientation", ToQString(PageOrientationName(config.m_Orientation)));
        settings.setValue("Scaling.Factor", config.m_ScalingFactor);
        settings.setValue("Image.Spacing", ToQString(FormatLength(config.m_Spacing, config.m_BaseUnit)));
        settings.setValue("Images.Per.Page", config.m_ImagesPerPage);
        settings.setValue("Image.Order", ToQString(magic_enum::enum_name(config.m_ImageOrder)));
        settings.setValue("Image.Order.Direction", ToQString(magic_enum::enum_name(config.m_ImageOrderDirection)));
        settings.setValue("Captions", config.m_Captions);
        settings.setValue("Caption.Font.Size", config.m_CaptionFontSize);
        settings.setValue("Document.Format", ToQString(magic_enum::enum_name(config.m_DocumentFormat)));
        settings.setValue("Base.Unit", ToQString(UnitShortName(config.m_BaseUnit)));
        settings.setValue("Latex.Binary", ToQString(config.m_LatexBinary));
        settings.setValue("Latex.Runs", config.m_LatexRuns);

        settings.endGroup();
    }
    settings.sync();
}
