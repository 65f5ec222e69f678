#include <pbk/document/json_document.hpp>

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

#include <pbk/book/book.hpp>
#include <pbk/json_util.hpp>
#include <pbk/util/log.hpp>
#include <pbk/version.hpp>

static float ToUnit(Length length, Unit unit)
{
    return static_cast<float>(length / UnitValue(unit));
}

static nlohmann::json ToJson(Size size, Unit unit)
{
    return nlohmann::json{
        { "width", ToUnit(size.x, unit) },
        { "height", ToUnit(size.y, unit) },
    };
}

JsonPage::JsonPage(Unit unit)
    : m_Images{ nlohmann::json::array() }
    , m_Unit{ unit }
{
}

void JsonPage::DrawImage(ImageData data)
{
    nlohmann::json image{ nlohmann::json::object() };
    SetJsonValue(image, "name", data.m_Image.m_Name.generic_string());
    SetJsonValue(image, "path", data.m_Image.m_Path.generic_string());
    SetJsonValue(image, "pos.x", ToUnit(data.m_Pos.x, m_Unit));
    SetJsonValue(image, "pos.y", ToUnit(data.m_Pos.y, m_Unit));
    SetJsonValue(image, "size", ToJson(data.m_Size, m_Unit));
    SetJsonValue(image, "scale", data.m_Image.m_Scale);
    m_Images.push_back(std::move(image));
}

void JsonPage::DrawCaption(CaptionData data)
{
    if (!m_Images.empty())
    {
        SetJsonValue(m_Images.back(), "caption", std::string{ data.m_Text });
    }
}

void JsonPage::Finish()
{
}

JsonDocument::JsonDocument(const BookSettings& settings, const BookLayout& layout)
    : m_Json{ nlohmann::json::object() }
    , m_Unit{ settings.m_Unit }
{
    const auto& geometry{ layout.m_Geometry };

    SetJsonValue(m_Json, "version", std::string{ JsonFormatVersion() });
    SetJsonValue(m_Json, "unit", std::string{ UnitShortName(m_Unit) });
    SetJsonValue(m_Json, "page.size_class", ToLower(PageSizeClassName(geometry.m_PageSizeClass)));
    SetJsonValue(m_Json, "page.orientation", ToLower(PageOrientationName(geometry.m_Orientation)));
    SetJsonValue(m_Json, "page.size", ToJson(geometry.m_PageSize, m_Unit));
    SetJsonValue(m_Json, "page.margin", ToUnit(geometry.m_Margin, m_Unit));
    SetJsonValue(m_Json, "page.usable", ToJson(geometry.m_UsableSize, m_Unit));
    SetJsonValue(m_Json, "spacing", ToUnit(layout.m_Spacing, m_Unit));
    SetJsonValue(m_Json, "captions", settings.m_Captions);

    nlohmann::json skipped{ nlohmann::json::array() };
    for (const SkippedImage& skipped_image : layout.m_Skipped)
    {
        skipped.push_back({
            { "name", skipped_image.m_Name.generic_string() },
            { "reason", skipped_image.m_Reason },
        });
    }
    SetJsonValue(m_Json, "skipped", std::move(skipped));
}

JsonPage* JsonDocument::NextPage()
{
    m_Pages.emplace_back(new JsonPage{ m_Unit });
    return m_Pages.back().get();
}

fs::path JsonDocument::Write(fs::path path)
{
    const auto json_path{ path.replace_extension(".json") };
    LogInfo("Saving to {}...", json_path.string());

    nlohmann::json pages{ nlohmann::json::array() };
    for (const auto& page : m_Pages)
    {
        pages.push_back({
            { "images", page->m_Images },
        });
    }
    SetJsonValue(m_Json, "pages", std::move(pages));

    std::ofstream json_file{ json_path };
    if (!json_file)
    {
        throw std::logic_error{ fmt::format("Could not open {} for writing", json_path.string()) };
    }

    json_file << m_Json.dump(4) << '\n';
    if (!json_file)
    {
        throw std::logic_error{ fmt::format("Failed writing {}", json_path.string()) };
    }

    return json_path;
}
