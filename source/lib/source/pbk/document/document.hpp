#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include <pbk/config.hpp>
#include <pbk/util.hpp>

struct BookSettings;
struct BookLayout;
struct PlacedImage;
class Document;

std::unique_ptr<Document> CreateDocument(DocumentFormat format, const BookSettings& settings, const BookLayout& layout);

class DocumentPage
{
  public:
    virtual ~DocumentPage() = default;

    struct ImageData
    {
        const PlacedImage& m_Image;
        Position m_Pos;
        Size m_Size;
    };

    struct CaptionData
    {
        std::string_view m_Text;
        Position m_Pos;
        Size m_Size;
        uint32_t m_FontSize;
    };

    // All positions are top-left corners, measured from the top-left corner of the page
    virtual void DrawImage(ImageData data) = 0;

    // Always follows the DrawImage call of the image it belongs to
    virtual void DrawCaption(CaptionData data) = 0;

    virtual void Finish() = 0;
};

class Document
{
  public:
    virtual ~Document() = default;

    virtual DocumentPage* NextPage() = 0;

    // The extension of path is replaced by the extension of the document format
    virtual fs::path Write(fs::path path) = 0;
};
