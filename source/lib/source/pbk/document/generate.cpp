#include <pbk/document/generate.hpp>

#include <stdexcept>
#include <string>
#include <system_error>

#include <fmt/format.h>

#include <pbk/book/book.hpp>
#include <pbk/document/document.hpp>
#include <pbk/util/log.hpp>

ImageTransforms ComputeTransforms(const BookLayout& layout, const Page& page)
{
    const auto& geometry{ layout.m_Geometry };

    ImageTransforms transforms;
    transforms.reserve(page.m_Images.size());

    Length y{ geometry.m_Margin };
    for (const PlacedImage& image : page.m_Images)
    {
        const Length x{ (geometry.m_PageSize.x - image.m_Size.x) / 2.0f };
        transforms.push_back(ImageTransform{
            .m_Position{ x, y },
            .m_Size = image.m_Size,
        });
        y = y + image.m_Size.y + layout.m_Spacing;
    }

    return transforms;
}

fs::path GenerateDocument(const BookSettings& settings, const BookLayout& layout)
{
    {
        std::error_code error;
        fs::create_directories(settings.m_OutputDir, error);
        if (error)
        {
            throw std::logic_error{
                fmt::format("Could not create output directory {}: {}", settings.m_OutputDir.string(), error.message())
            };
        }
    }

    auto document{ CreateDocument(settings.m_DocumentFormat, settings, layout) };
    if (document == nullptr)
    {
        throw std::logic_error{ "Unsupported document format" };
    }

    const auto& geometry{ layout.m_Geometry };
    for (size_t p = 0; p < layout.m_Pages.size(); p++)
    {
        const Page& page{ layout.m_Pages[p] };
        const ImageTransforms transforms{ ComputeTransforms(layout, page) };

        DocumentPage* document_page{ document->NextPage() };
        for (size_t i = 0; i < page.m_Images.size(); ++i)
        {
            const auto& image{ page.m_Images[i] };
            const auto& transform{ transforms[i] };

            LogDebug("Page {}, image {}: {}", p + 1, i + 1, image.m_Name.string());
            document_page->DrawImage({
                .m_Image = image,
                .m_Pos = transform.m_Position,
                .m_Size = transform.m_Size,
            });

            if (settings.m_Captions)
            {
                const std::string caption{ image.m_Name.string() };
                document_page->DrawCaption({
                    .m_Text = caption,
                    .m_Pos{ geometry.m_Margin, transform.m_Position.y + transform.m_Size.y },
                    .m_Size{ geometry.m_UsableSize.x, layout.m_Spacing },
                    .m_FontSize = settings.m_CaptionFontSize,
                });
            }
        }
        document_page->Finish();
    }

    return document->Write(settings.m_OutputDir / settings.m_DocumentName);
}
