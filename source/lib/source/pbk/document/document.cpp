#include <pbk/document/document.hpp>

#include <pbk/document/json_document.hpp>
#include <pbk/document/latex_document.hpp>
#include <pbk/document/podofo_document.hpp>

std::unique_ptr<Document> CreateDocument(DocumentFormat format, const BookSettings& settings, const BookLayout& layout)
{
    switch (format)
    {
    case DocumentFormat::Latex:
        return std::make_unique<LatexDocument>(settings, layout);
    case DocumentFormat::Json:
        return std::make_unique<JsonDocument>(settings, layout);
    case DocumentFormat::Pdf:
        return std::make_unique<PoDoFoDocument>(settings, layout);
    default:
        return nullptr;
    }
}
