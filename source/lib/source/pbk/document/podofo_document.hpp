#pragma once

#include <memory>
#include <vector>

#include <podofo/main/PdfImage.h>
#include <podofo/main/PdfMemDocument.h>
#include <podofo/main/PdfPainter.h>

#include <pbk/document/document.hpp>

class PoDoFoDocument;

class PoDoFoPage final : public DocumentPage
{
    friend class PoDoFoDocument;

  public:
    virtual ~PoDoFoPage() override = default;

    virtual void DrawImage(ImageData data) override;

    virtual void DrawCaption(CaptionData data) override;

    virtual void Finish() override;

  private:
    PoDoFoPage(PoDoFo::PdfPage* page,
               PoDoFoDocument* document,
               Length page_height);

    PoDoFo::PdfPage* m_Page{ nullptr };
    PoDoFo::PdfPainter m_Painter;
    PoDoFoDocument* m_Document{ nullptr };
    Length m_PageHeight;
};

class PoDoFoDocument final : public Document
{
  public:
    PoDoFoDocument(const BookSettings& settings, const BookLayout& layout);
    virtual ~PoDoFoDocument() override = default;

    virtual PoDoFoPage* NextPage() override;

    virtual fs::path Write(fs::path path) override;

    PoDoFo::PdfFont& GetFont();
    PoDoFo::PdfImage* LoadImage(const fs::path& image_path);

  private:
    Size m_PageSize;

    PoDoFo::PdfMemDocument m_Document;
    std::vector<std::unique_ptr<PoDoFoPage>> m_Pages;
    std::vector<std::unique_ptr<PoDoFo::PdfImage>> m_Images;
};
