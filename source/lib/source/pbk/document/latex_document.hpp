#pragma once

#include <memory>
#include <string>
#include <vector>

#include <pbk/document/document.hpp>

class LatexDocument;

class LatexPage final : public DocumentPage
{
    friend class LatexDocument;

  public:
    virtual ~LatexPage() override = default;

    virtual void DrawImage(ImageData data) override;

    virtual void DrawCaption(CaptionData data) override;

    virtual void Finish() override;

  private:
    LatexPage(std::string& source, Length spacing);

    void FlushSpacing();

    std::string& m_Source;
    Length m_Spacing;
    bool m_SpacingPending{ false };
};

class LatexDocument final : public Document
{
  public:
    LatexDocument(const BookSettings& settings, const BookLayout& layout);
    virtual ~LatexDocument() override = default;

    virtual LatexPage* NextPage() override;

    virtual fs::path Write(fs::path path) override;

  private:
    std::string m_Source;
    Length m_Spacing;
    std::vector<std::unique_ptr<LatexPage>> m_Pages;
};
