#pragma once

#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

#include <pbk/document/document.hpp>
#include <pbk/units.hpp>

class JsonDocument;

class JsonPage final : public DocumentPage
{
    friend class JsonDocument;

  public:
    virtual ~JsonPage() override = default;

    virtual void DrawImage(ImageData data) override;

    virtual void DrawCaption(CaptionData data) override;

    virtual void Finish() override;

  private:
    explicit JsonPage(Unit unit);

    nlohmann::json m_Images;
    Unit m_Unit;
};

class JsonDocument final : public Document
{
  public:
    JsonDocument(const BookSettings& settings, const BookLayout& layout);
    virtual ~JsonDocument() override = default;

    virtual JsonPage* NextPage() override;

    virtual fs::path Write(fs::path path) override;

  private:
    nlohmann::json m_Json;
    Unit m_Unit;
    std::vector<std::unique_ptr<JsonPage>> m_Pages;
};
