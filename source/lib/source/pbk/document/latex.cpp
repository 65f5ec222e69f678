#include <pbk/document/latex.hpp>

#include <QProcess>
#include <QStringList>

#include <pbk/qt_util.hpp>
#include <pbk/util/log.hpp>

std::string EscapeLatex(std::string_view text)
{
    static constexpr std::string_view c_SpecialCharacters{ "_&%$#{}" };

    std::string escaped;
    escaped.reserve(text.size());
    for (const char c : text)
    {
        switch (c)
        {
        case '~':
            escaped += "\\textasciitilde{}";
            break;
        case '^':
            escaped += "\\textasciicircum{}";
            break;
        case '\\':
            escaped += "\\textbackslash{}";
            break;
        default:
            if (c_SpecialCharacters.find(c) != std::string_view::npos)
            {
                escaped += '\\';
            }
            escaped += c;
            break;
        }
    }
    return escaped;
}

bool CompileLatex(const fs::path& tex_file, const std::string& binary, uint32_t runs)
{
    const fs::path output_dir{ fs::absolute(tex_file).parent_path() };
    const QStringList arguments{
        "-interaction=nonstopmode",
        "-output-directory",
        ToQString(output_dir),
        ToQString(tex_file),
    };

    // Multiple runs so that references settle
    for (uint32_t run = 0; run < runs; run++)
    {
        LogInfo("Running {} on {}, pass {} of {}...", binary, tex_file.string(), run + 1, runs);

        QProcess process;
        process.start(ToQString(binary), arguments);
        if (!process.waitForStarted())
        {
            LogError("Could not run {}, please install a LaTeX distribution, e.g. texlive-latex-base", binary);
            return false;
        }

        process.waitForFinished(-1);
        if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0)
        {
            LogError("LaTeX compilation failed with exit code {}. Error output:\n{}\nStandard output:\n{}",
                     process.exitCode(),
                     process.readAllStandardError().toStdString(),
                     process.readAllStandardOutput().toStdString());
            return false;
        }
    }

    return true;
}
