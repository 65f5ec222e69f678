#include <pbk/document/latex_document.hpp>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

#include <pbk/book/book.hpp>
#include <pbk/document/latex.hpp>
#include <pbk/util/log.hpp>

static std::string ToLatexInches(Length length)
{
    return fmt::format("{:.4f}in", ToInches(length));
}

// Each image block may shrink by this much, rounding of the written lengths must not break pages
inline constexpr Length c_LatexShrink{ 0.001_in };

// Reads the file name with special characters as plain text, so % # & $ _ ^ ~ and \ are valid in file names
static constexpr std::string_view c_ImageMacros{
    "\\newcommand{\\pbkimage}[1][]{\\begingroup\n"
    "  \\catcode`\\\\=12 \\catcode`\\%=12 \\catcode`\\#=12 \\catcode`\\&=12\n"
    "  \\catcode`\\$=12 \\catcode`\\_=12 \\catcode`\\^=12 \\catcode`\\~=12\n"
    "  \\pbkimagefile{#1}}\n"
    "\\newcommand{\\pbkimagefile}[2]{\\includegraphics[#1]{#2}\\endgroup}\n"
};

// No vertical material besides what is written for each image
static constexpr std::string_view c_VerticalSetup{
    "\\setlength{\\parindent}{0pt}\n"
    "\\setlength{\\parskip}{0pt}\n"
    "\\setlength{\\topskip}{0pt}\n"
    "\\offinterlineskip\n"
};

LatexPage::LatexPage(std::string& source, Length spacing)
    : m_Source{ source }
    , m_Spacing{ spacing }
{
}

void LatexPage::DrawImage(ImageData data)
{
    FlushSpacing();

    // graphicx resolves the file name relative to \graphicspath
    fmt::format_to(std::back_inserter(m_Source),
                   "{{\\centering\\pbkimage[width={},height={}]{{{}}}\\par}}\n",
                   ToLatexInches(data.m_Size.x),
                   ToLatexInches(data.m_Size.y),
                   data.m_Image.m_Name.generic_string());

    m_SpacingPending = true;
}

void LatexPage::DrawCaption(CaptionData data)
{
    // The caption box replaces the spacing below the image
    const uint32_t baseline_skip{ data.m_FontSize + data.m_FontSize / 4 };
    fmt::format_to(std::back_inserter(m_Source),
                   "\\nopagebreak\n"
                   "\\noindent\\parbox[t][{}][t]{{\\linewidth}}{{\\centering\\vspace{{0.1in}}"
                   "{{\\fontsize{{{}}}{{{}}}\\selectfont\\texttt{{{}}}}}}}\\par\n"
                   "\\vspace{{0pt minus {}}}\n",
                   ToLatexInches(data.m_Size.y),
                   data.m_FontSize,
                   baseline_skip,
                   EscapeLatex(data.m_Text),
                   ToLatexInches(c_LatexShrink));

    m_SpacingPending = false;
}

void LatexPage::Finish()
{
    FlushSpacing();
    m_Source += "\\clearpage\n\n";
}

void LatexPage::FlushSpacing()
{
    if (m_SpacingPending)
    {
        fmt::format_to(std::back_inserter(m_Source),
                       "\\vspace{{{} minus {}}}\n",
                       ToLatexInches(m_Spacing),
                       ToLatexInches(c_LatexShrink));
        m_SpacingPending = false;
    }
}

LatexDocument::LatexDocument(const BookSettings& settings, const BookLayout& layout)
    : m_Spacing{ layout.m_Spacing }
{
    const auto& geometry{ layout.m_Geometry };

    auto out{ std::back_inserter(m_Source) };
    fmt::format_to(out,
                   "\\documentclass{{article}}\n"
                   "\\usepackage{{graphicx}}\n"
                   "\\usepackage[utf8]{{inputenc}}\n"
                   "\\usepackage[margin={}]{{geometry}}\n"
                   "\\geometry{{paperwidth={},paperheight={}}}\n"
                   "\\graphicspath{{{{{}/}}}}\n"
                   "\\pagestyle{{empty}}\n"
                   "{}"
                   "\\begin{{document}}\n"
                   "{}\n",
                   ToLatexInches(geometry.m_Margin),
                   ToLatexInches(geometry.m_PageSize.x),
                   ToLatexInches(geometry.m_PageSize.y),
                   fs::absolute(settings.m_ImageDir).generic_string(),
                   c_ImageMacros,
                   c_VerticalSetup);
}

LatexPage* LatexDocument::NextPage()
{
    m_Pages.emplace_back(new LatexPage{ m_Source, m_Spacing });
    return m_Pages.back().get();
}

fs::path LatexDocument::Write(fs::path path)
{
    const auto tex_path{ path.replace_extension(".tex") };
    LogInfo("Saving to {}...", tex_path.string());

    std::ofstream tex_file{ tex_path };
    if (!tex_file)
    {
        throw std::logic_error{ fmt::format("Could not open {} for writing", tex_path.string()) };
    }

    tex_file << m_Source << "\\end{document}\n";
    if (!tex_file)
    {
        throw std::logic_error{ fmt::format("Failed writing {}", tex_path.string()) };
    }

    return tex_path;
}
