#include <pbk/document/podofo_document.hpp>

#include <fstream>
#include <iterator>
#include <stdexcept>

#include <fmt/format.h>

#include <podofo/podofo.h>

#include <pbk/book/book.hpp>
#include <pbk/image.hpp>
#include <pbk/util/log.hpp>

inline double ToPoDoFoPoints(Length l)
{
    return static_cast<double>(l / 1_pts);
}

class PainterStateGuard
{
  public:
    explicit PainterStateGuard(PoDoFo::PdfPainter& painter)
        : m_Painter{ painter }
    {
        m_Painter.Save();
    }
    ~PainterStateGuard()
    {
        m_Painter.Restore();
    }

    PainterStateGuard(const PainterStateGuard&) = delete;
    PainterStateGuard& operator=(const PainterStateGuard&) = delete;

  private:
    PoDoFo::PdfPainter& m_Painter;
};

PoDoFoPage::PoDoFoPage(PoDoFo::PdfPage* page,
                       PoDoFoDocument* document,
                       Length page_height)
    : m_Page{ page }
    , m_Document{ document }
    , m_PageHeight{ page_height }
{
    m_Painter.SetCanvas(*m_Page, PoDoFo::PdfPainterFlags::NoSaveRestorePrior);
}

void PoDoFoPage::DrawImage(ImageData data)
{
    // Pdf coordinates start at the bottom-left corner
    const auto real_x{ ToPoDoFoPoints(data.m_Pos.x) };
    const auto real_y{ ToPoDoFoPoints(m_PageHeight - data.m_Pos.y - data.m_Size.y) };
    const auto real_w{ ToPoDoFoPoints(data.m_Size.x) };
    const auto real_h{ ToPoDoFoPoints(data.m_Size.y) };

    try
    {
        auto* image{ m_Document->LoadImage(data.m_Image.m_Path) };
        const auto w_scale{ real_w / image->GetWidth() };
        const auto h_scale{ real_h / image->GetHeight() };

        PainterStateGuard save{ m_Painter };
        m_Painter.DrawImage(*image, real_x, real_y, w_scale, h_scale);
    }
    catch (const PoDoFo::PdfError& e)
    {
        throw std::logic_error{
            fmt::format("Failed drawing {}: {}", data.m_Image.m_Name.string(), e.what())
        };
    }
}

void PoDoFoPage::DrawCaption(CaptionData data)
{
    const PoDoFo::Rect rect{
        ToPoDoFoPoints(data.m_Pos.x),
        ToPoDoFoPoints(m_PageHeight - data.m_Pos.y - data.m_Size.y),
        ToPoDoFoPoints(data.m_Size.x),
        ToPoDoFoPoints(data.m_Size.y),
    };
    auto& font{ m_Document->GetFont() };

    PainterStateGuard save{ m_Painter };
    m_Painter.TextState.SetFont(font, static_cast<double>(data.m_FontSize));

    PoDoFo::PdfDrawTextMultiLineParams params{
        .HorizontalAlignment = PoDoFo::PdfHorizontalAlignment::Center,
        .VerticalAlignment = PoDoFo::PdfVerticalAlignment::Top,
    };
    m_Painter.DrawTextMultiLine(data.m_Text,
                                rect,
                                params);
}

void PoDoFoPage::Finish()
{
    m_Painter.FinishDrawing();
}

PoDoFoDocument::PoDoFoDocument(const BookSettings& /*settings*/, const BookLayout& layout)
    : m_PageSize{ layout.m_Geometry.m_PageSize }
{
}

PoDoFoPage* PoDoFoDocument::NextPage()
{
    const auto new_page_idx{ static_cast<unsigned>(m_Pages.size()) };
    PoDoFo::PdfPage* page{
        &m_Document.GetPages().CreatePageAt(
            new_page_idx,
            PoDoFo::Rect(
                0.0,
                0.0,
                ToPoDoFoPoints(m_PageSize.x),
                ToPoDoFoPoints(m_PageSize.y))),
    };

    m_Pages.emplace_back(new PoDoFoPage{ page, this, m_PageSize.y });
    return m_Pages.back().get();
}

fs::path PoDoFoDocument::Write(fs::path path)
{
    try
    {
        const auto pdf_path{ path.replace_extension(".pdf") };
        LogInfo("Saving to {}...", pdf_path.string());
        m_Document.Save(pdf_path.string());
        return pdf_path;
    }
    catch (const PoDoFo::PdfError& e)
    {
        // Rethrow as a std::exception so the agnostic code can catch it
        throw std::logic_error{ e.what() };
    }
}

PoDoFo::PdfFont& PoDoFoDocument::GetFont()
{
    return m_Document
        .GetFonts()
        .GetStandard14Font(PoDoFo::PdfStandard14FontType::Courier);
}

PoDoFo::PdfImage* PoDoFoDocument::LoadImage(const fs::path& image_path)
{
    std::vector<char> image_buffer;

    // Jpg data is embedded as is, everything else is re-encoded as png
    const std::string extension{ ToLower(image_path.extension().string()) };
    if (extension == ".jpg" || extension == ".jpeg")
    {
        std::ifstream image_file{ image_path, std::ios::binary };
        if (!image_file)
        {
            throw std::logic_error{ fmt::format("Could not open {}", image_path.string()) };
        }
        image_buffer.assign(std::istreambuf_iterator<char>{ image_file }, std::istreambuf_iterator<char>{});
    }
    else
    {
        const Image image{ Image::Read(image_path) };
        const EncodedImage encoded_image{ image.EncodePng() };
        if (encoded_image.empty())
        {
            throw std::logic_error{ fmt::format("Could not encode {}", image_path.string()) };
        }
        const auto* const data{ reinterpret_cast<const char*>(encoded_image.data()) };
        image_buffer.assign(data, data + encoded_image.size());
    }

    std::unique_ptr podofo_image{ m_Document.CreateImage() };
    podofo_image->LoadFromBuffer(
        PoDoFo::bufferview{
            image_buffer.data(),
            image_buffer.size(),
        });

    m_Images.push_back(std::move(podofo_image));
    return m_Images.back().get();
}
