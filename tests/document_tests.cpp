#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <nlohmann/json.hpp>

#include <pbk/book/book.hpp>
#include <pbk/document/generate.hpp>
#include <pbk/document/latex.hpp>

#include "test_util.hpp"

using Catch::Matchers::WithinAbs;

static std::string ReadFile(const fs::path& path)
{
    std::ifstream file{ path };
    std::stringstream stream;
    stream << file.rdbuf();
    return stream.str();
}

static size_t CountOccurrences(std::string_view text, std::string_view pattern)
{
    size_t count{ 0 };
    for (size_t pos = text.find(pattern); pos != std::string_view::npos; pos = text.find(pattern, pos + 1))
    {
        count++;
    }
    return count;
}

// Three images, 4in high each, two on the first page and one on the second
static BookSettings MakeBook(const TestFolder& folder, DocumentFormat format)
{
    REQUIRE(WriteTestImage(folder.Path() / "my_photo #1.png", 576, 384));
    REQUIRE(WriteTestImage(folder.Path() / "photo2.png", 576, 384));
    REQUIRE(WriteTestImage(folder.Path() / "photo3.jpg", 576, 384));
    SetLastWriteTime(folder.Path() / "my_photo #1.png", 1);
    SetLastWriteTime(folder.Path() / "photo2.png", 2);
    SetLastWriteTime(folder.Path() / "photo3.jpg", 3);

    BookSettings settings{};
    settings.m_ImageDir = folder.Path();
    settings.m_OutputDir = folder.Path() / "output";
    settings.m_DocumentName = "book";
    settings.m_DocumentFormat = format;
    settings.m_Spacing = 0.3_in;
    return settings;
}

TEST_CASE("LaTeX special characters are escaped", "[latex_escape]")
{
    REQUIRE(EscapeLatex("plain.png") == "plain.png");
    REQUIRE(EscapeLatex("my_photo.png") == "my\\_photo.png");
    REQUIRE(EscapeLatex("a&b%c$d#e{f}g") == "a\\&b\\%c\\$d\\#e\\{f\\}g");
    REQUIRE(EscapeLatex("g~h^i") == "g\\textasciitilde{}h\\textasciicircum{}i");
    REQUIRE(EscapeLatex("a\\b") == "a\\textbackslash{}b");
}

TEST_CASE("Images are centered and stacked from the top margin", "[document_transforms]")
{
    BookLayout layout{
        .m_Geometry = ComputeUsablePage(PageSizeClass::Letter, PageOrientation::Portrait),
        .m_Spacing = 0.3_in,
    };
    const Page page{
        .m_Images{
            PlacedImage{ .m_Name = "a.png", .m_Size{ 6.5_in, 4_in }, .m_Scale = 1.0f },
            PlacedImage{ .m_Name = "b.png", .m_Size{ 2.5_in, 3_in }, .m_Scale = 1.0f },
        },
        .m_ConsumedHeight = 7.6_in,
    };

    const ImageTransforms transforms{ ComputeTransforms(layout, page) };
    REQUIRE(transforms.size() == 2);
    REQUIRE_THAT(ToInches(transforms[0].m_Position.x), WithinAbs(1.0f, 0.001f));
    REQUIRE_THAT(ToInches(transforms[0].m_Position.y), WithinAbs(0.5f, 0.001f));
    REQUIRE_THAT(ToInches(transforms[1].m_Position.x), WithinAbs(3.0f, 0.001f));
    REQUIRE_THAT(ToInches(transforms[1].m_Position.y), WithinAbs(4.8f, 0.001f));
    REQUIRE_THAT(ToInches(transforms[1].m_Size.y), WithinAbs(3.0f, 0.001f));
}

TEST_CASE("Generate a LaTeX document", "[document_latex]")
{
    TestFolder folder{ "document_latex" };
    const BookSettings settings{ MakeBook(folder, DocumentFormat::Latex) };
    const BookLayout layout{ BuildBookLayout(settings) };
    REQUIRE(layout.m_Pages.size() == 2);

    const fs::path tex_path{ GenerateDocument(settings, layout) };
    REQUIRE(tex_path == settings.m_OutputDir / "book.tex");
    REQUIRE(fs::exists(tex_path));

    const std::string tex{ ReadFile(tex_path) };
    REQUIRE(tex.starts_with("\\documentclass{article}\n"));
    REQUIRE(tex.find("\\usepackage{graphicx}") != std::string::npos);
    REQUIRE(tex.find("\\usepackage[margin=0.5000in]{geometry}") != std::string::npos);
    REQUIRE(tex.find("\\geometry{paperwidth=8.5000in,paperheight=11.0000in}") != std::string::npos);
    REQUIRE(tex.find("\\graphicspath{{") != std::string::npos);
    REQUIRE(tex.find("\\pagestyle{empty}") != std::string::npos);
    REQUIRE(tex.find("\\offinterlineskip") != std::string::npos);
    REQUIRE(tex.find("{\\centering\\pbkimage[width=6.0000in,height=4.0000in]{photo2.png}\\par}") != std::string::npos);
    REQUIRE(tex.find("\\pbkimage[width=6.0000in,height=4.0000in]{my_photo #1.png}") != std::string::npos);
    REQUIRE(tex.find("\\parbox[t][0.3000in][t]{\\linewidth}") != std::string::npos);
    REQUIRE(tex.find("\\texttt{my\\_photo \\#1.png}") != std::string::npos);
    REQUIRE(tex.ends_with("\\end{document}\n"));

    REQUIRE(CountOccurrences(tex, "\\pbkimage[") == 3);
    REQUIRE(CountOccurrences(tex, "\\parbox") == 3);
    REQUIRE(CountOccurrences(tex, "\\nopagebreak") == 3);
    REQUIRE(CountOccurrences(tex, "\\begin{center}") == 0);
    REQUIRE(CountOccurrences(tex, "\\clearpage") == 2);

    // Page order follows the layout
    REQUIRE(tex.find("{my_photo #1.png}") < tex.find("{photo2.png}"));
    REQUIRE(tex.find("{photo2.png}") < tex.find("\\clearpage"));
    REQUIRE(tex.find("\\clearpage") < tex.find("{photo3.jpg}"));
}

TEST_CASE("Generate a LaTeX document without captions", "[document_latex_no_captions]")
{
    TestFolder folder{ "document_latex_no_captions" };
    BookSettings settings{ MakeBook(folder, DocumentFormat::Latex) };
    settings.m_Captions = false;

    const fs::path tex_path{ GenerateDocument(settings, BuildBookLayout(settings)) };
    const std::string tex{ ReadFile(tex_path) };
    REQUIRE(CountOccurrences(tex, "\\texttt") == 0);
    REQUIRE(CountOccurrences(tex, "\\parbox") == 0);
    REQUIRE(CountOccurrences(tex, "\\pbkimage[") == 3);
    REQUIRE(CountOccurrences(tex, "\\vspace{0.3000in minus 0.0010in}") == 3);
}

// Sums the natural height of the vertical material written for each page
static std::vector<float> LatexPageHeights(const std::string& tex)
{
    static const std::regex c_VerticalMaterial{
        R"(height=([0-9.]+)in\]|\\parbox\[t\]\[([0-9.]+)in\]|\\vspace\{([0-9.]+)in minus)"
    };

    const size_t body_begin{ tex.find("\\begin{document}") };
    const size_t body_end{ tex.find("\\end{document}") };
    REQUIRE(body_begin != std::string::npos);
    REQUIRE(body_end != std::string::npos);

    std::vector<float> heights;
    size_t page_begin{ body_begin };
    for (size_t page_end = tex.find("\\clearpage", page_begin);
         page_end != std::string::npos && page_end < body_end;
         page_end = tex.find("\\clearpage", page_begin))
    {
        const std::string page{ tex.substr(page_begin, page_end - page_begin) };

        float height{ 0.0f };
        for (auto it = std::sregex_iterator(page.begin(), page.end(), c_VerticalMaterial); it != std::sregex_iterator{}; ++it)
        {
            for (size_t group = 1; group < it->size(); group++)
            {
                if ((*it)[group].matched)
                {
                    height += std::stof((*it)[group].str());
                }
            }
        }
        heights.push_back(height);

        page_begin = page_end + 1;
    }
    return heights;
}

TEST_CASE("LaTeX pages take the height the layout reserves", "[document_latex_vertical]")
{
    TestFolder folder{ "document_latex_vertical" };
    BookSettings settings{ MakeBook(folder, DocumentFormat::Latex) };

    SECTION("Greedy with and without captions")
    {
        for (const bool captions : { true, false })
        {
            settings.m_Captions = captions;
            const BookLayout layout{ BuildBookLayout(settings) };
            const std::vector<float> heights{ LatexPageHeights(ReadFile(GenerateDocument(settings, layout))) };

            REQUIRE(heights.size() == layout.m_Pages.size());
            for (size_t i = 0; i < heights.size(); i++)
            {
                REQUIRE_THAT(heights[i], WithinAbs(ToInches(layout.m_Pages[i].m_ConsumedHeight), 0.001f));
            }
        }
    }

    SECTION("Two images per page close to the slot height")
    {
        TestFolder slot_folder{ "document_latex_vertical_slots" };
        for (const char* name : { "a.png", "b.png", "c.png", "d.png" })
        {
            // 4in x 4.625in, the slot is 7.5in x 4.7in
            REQUIRE(WriteTestImage(slot_folder.Path() / name, 384, 444));
        }
        settings.m_ImageDir = slot_folder.Path();
        settings.m_OutputDir = slot_folder.Path() / "output";
        settings.m_Paging = FixedCountPaging(2);

        const BookLayout layout{ BuildBookLayout(settings) };
        REQUIRE(layout.m_Pages.size() == 2);
        REQUIRE(layout.m_Pages[0].m_Images.size() == 2);

        const std::vector<float> heights{ LatexPageHeights(ReadFile(GenerateDocument(settings, layout))) };
        REQUIRE(heights.size() == 2);
        for (size_t i = 0; i < heights.size(); i++)
        {
            REQUIRE_THAT(heights[i], WithinAbs(ToInches(layout.m_Pages[i].m_ConsumedHeight), 0.001f));
            REQUIRE(heights[i] <= 10.0f + 0.001f);
        }
    }
}

TEST_CASE("LaTeX file names keep their special characters", "[document_latex_file_names]")
{
    TestFolder folder{ "document_latex_file_names" };
    REQUIRE(WriteTestImage(folder.Path() / "100% fun~^1.png", 96, 96));

    BookSettings settings{};
    settings.m_ImageDir = folder.Path();
    settings.m_OutputDir = folder.Path() / "output";
    settings.m_DocumentName = "book";

    const std::string tex{ ReadFile(GenerateDocument(settings, BuildBookLayout(settings))) };
    REQUIRE(tex.find("\\catcode`\\%=12") != std::string::npos);
    REQUIRE(tex.find("\\pbkimage[width=1.0000in,height=1.0000in]{100% fun~^1.png}") != std::string::npos);
    REQUIRE(tex.find("\\texttt{100\\% fun\\textasciitilde{}\\textasciicircum{}1.png}") != std::string::npos);
}

TEST_CASE("Generate a json document", "[document_json]")
{
    TestFolder folder{ "document_json" };
    WriteTextFile(folder.Path() / "broken.png", "not a png");
    const BookSettings settings{ MakeBook(folder, DocumentFormat::Json) };

    const fs::path json_path{ GenerateDocument(settings, BuildBookLayout(settings)) };
    REQUIRE(json_path == settings.m_OutputDir / "book.json");

    const nlohmann::json json{ nlohmann::json::parse(ReadFile(json_path)) };
    REQUIRE(json["unit"] == "in");
    REQUIRE(json["page"]["size_class"] == "letter");
    REQUIRE(json["page"]["orientation"] == "portrait");
    REQUIRE_THAT(json["page"]["size"]["width"].get<float>(), WithinAbs(8.5f, 0.001f));
    REQUIRE_THAT(json["page"]["usable"]["height"].get<float>(), WithinAbs(10.0f, 0.001f));
    REQUIRE_THAT(json["spacing"].get<float>(), WithinAbs(0.3f, 0.001f));

    const auto& pages{ json["pages"] };
    REQUIRE(pages.size() == 2);
    REQUIRE(pages[0]["images"].size() == 2);
    REQUIRE(pages[1]["images"].size() == 1);

    const auto& first{ pages[0]["images"][0] };
    REQUIRE(first["name"] == "my_photo #1.png");
    REQUIRE(first["caption"] == "my_photo #1.png");
    REQUIRE_THAT(first["pos"]["x"].get<float>(), WithinAbs(1.25f, 0.001f));
    REQUIRE_THAT(first["pos"]["y"].get<float>(), WithinAbs(0.5f, 0.001f));
    REQUIRE_THAT(first["size"]["width"].get<float>(), WithinAbs(6.0f, 0.001f));
    REQUIRE_THAT(first["size"]["height"].get<float>(), WithinAbs(4.0f, 0.001f));
    REQUIRE_THAT(first["scale"].get<float>(), WithinAbs(1.0f, 0.001f));

    const auto& second{ pages[0]["images"][1] };
    REQUIRE_THAT(second["pos"]["y"].get<float>(), WithinAbs(4.8f, 0.001f));

    REQUIRE(json["skipped"].size() == 1);
    REQUIRE(json["skipped"][0]["name"] == "broken.png");
}

TEST_CASE("Generate a pdf document", "[document_pdf]")
{
    TestFolder folder{ "document_pdf" };
    REQUIRE(WriteTestImage(folder.Path() / "photo4.bmp", 96, 96));
    const BookSettings settings{ MakeBook(folder, DocumentFormat::Pdf) };

    const fs::path pdf_path{ GenerateDocument(settings, BuildBookLayout(settings)) };
    REQUIRE(pdf_path == settings.m_OutputDir / "book.pdf");
    REQUIRE(fs::exists(pdf_path));
    REQUIRE(ReadFile(pdf_path).starts_with("%PDF"));
}

TEST_CASE("Missing LaTeX binary fails gracefully", "[latex_compile_missing]")
{
    TestFolder folder{ "latex_compile_missing" };
    WriteTextFile(folder.Path() / "book.tex", "\\documentclass{article}\n\\begin{document}\n\\end{document}\n");
    REQUIRE_FALSE(CompileLatex(folder.Path() / "book.tex", "pbk-no-such-latex-binary"));
}
