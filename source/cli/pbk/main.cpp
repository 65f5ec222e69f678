#include <algorithm>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <QCoreApplication>

#include <pbk/book/book.hpp>
#include <pbk/config.hpp>
#include <pbk/document/generate.hpp>
#include <pbk/document/latex.hpp>
#include <pbk/errors.hpp>
#include <pbk/util/log.hpp>
#include <pbk/version.hpp>

enum ExitCode : int
{
    Success = 0,
    ConfigurationFailure = 1,
    DocumentFailure = 2,
};

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_VersionDisplayed{ false };
    bool m_Invalid{ false };

    bool m_NoPdf{ false };

    fs::path m_ConfigFile{ c_DefaultConfigPath };
    std::optional<std::string> m_SettingsFile{ std::nullopt };
    std::optional<std::string> m_SettingsJson{ std::nullopt };
    std::optional<fs::path> m_DumpSettingsFile{ std::nullopt };
    std::vector<std::pair<std::string, std::string>> m_SettingsOverrides{};
};

constexpr const char c_HelpStr[]{
    R"(
Command Line Interface for Picture-Book-Maker

    --help                      Display this information.
    --version                   Display the version.
    --config <file>             Read the application config from this file,
                                defaults to config.ini.
    --settings <file>           Load the book settings from this file.
    --settings <json>           Load the book settings from this json blob.
    --dump-settings <file>      Write the effective book settings to this file.
    --no-pdf                    Skip compiling the LaTeX document.
    --log-file                  Also write the log into logs/<timestamp>.log.
    --verbose                   Also log every image as it is placed.

Settings Overrides are formatted as follows:
    --<name> <value>            Will override the setting <name> with the
                                value <value> as if parsed as json, where
                                <name> is one of
                                    image_dir, output_dir, document_name,
                                    page_size, orientation, scaling, spacing,
                                    unit, images_per_page, order,
                                    order_direction, base_dpi, captions,
                                    caption_font_size, format, compile_pdf
                                For example:
                                    --page_size legal
                                    --spacing "0.25 in"
                                    --images_per_page 2

    The following names are accepted as well:
        --image-directory, --output-directory, --document-name, --page-size,
        --orientation, --image-dpi, --image-name-font-size
)"
};

static std::string_view ResolveSettingAlias(std::string_view name)
{
    static constexpr std::pair<std::string_view, std::string_view> c_Aliases[]{
        { "image-directory", "image_dir" },
        { "output-directory", "output_dir" },
        { "document-name", "document_name" },
        { "page-size", "page_size" },
        { "image-dpi", "base_dpi" },
        { "image-name-font-size", "caption_font_size" },
    };
    for (const auto& [alias, key] : c_Aliases)
    {
        if (alias == name)
        {
            return key;
        }
    }
    return name;
}

CommandLineOptions ParseCommandLine(std::span<char*> argv)
{
    CommandLineOptions cli;

    const auto has_arg{
        [&argv](std::string_view arg)
        {
            return std::ranges::find(argv, arg) != argv.end();
        }
    };

    if (has_arg("--help"))
    {
        fmt::print("{}", c_HelpStr);
        cli.m_HelpDisplayed = true;
        return cli;
    }

    if (has_arg("--version"))
    {
        fmt::print("Picture-Book-Maker {} (built {})\n", PictureBookVersion(), PictureBookBuildTime());
        cli.m_VersionDisplayed = true;
        return cli;
    }

    const auto next_param{
        [&](size_t& i, std::string_view arg) -> std::optional<std::string>
        {
            if (i + 1 >= argv.size())
            {
                LogError("Command line option {} expects a value", arg);
                cli.m_Invalid = true;
                return std::nullopt;
            }
            return std::string{ argv[++i] };
        }
    };

    for (size_t i = 1; i < argv.size() && !cli.m_Invalid; i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--no-pdf")
        {
            cli.m_NoPdf = true;
        }
        else if (arg == "--log-file" || arg == "--verbose")
        {
            // Handled before the log is created
        }
        else if (arg == "--config")
        {
            if (auto param{ next_param(i, arg) })
            {
                cli.m_ConfigFile = std::move(param).value();
            }
        }
        else if (arg == "--settings")
        {
            if (auto param{ next_param(i, arg) })
            {
                if (fs::exists(param.value()))
                {
                    cli.m_SettingsFile = std::move(param);
                }
                else
                {
                    cli.m_SettingsJson = std::move(param);
                }
            }
        }
        else if (arg == "--dump-settings")
        {
            if (auto param{ next_param(i, arg) })
            {
                cli.m_DumpSettingsFile = std::move(param).value();
            }
        }
        else if (arg.starts_with("--"))
        {
            const std::string_view key{ ResolveSettingAlias(arg.substr(2)) };
            if (!IsBookSettingKey(key))
            {
                LogError("Unknown command line option {}", arg);
                cli.m_Invalid = true;
            }
            else if (auto param{ next_param(i, arg) })
            {
                cli.m_SettingsOverrides.emplace_back(std::string{ key }, std::move(param).value());
            }
        }
        else
        {
            LogError("Error while parsing command line. Expected --<option> but got {}", arg);
            cli.m_Invalid = true;
        }
    }

    return cli;
}

static nlohmann::json OverridesToJson(const CommandLineOptions& cli)
{
    nlohmann::json overrides{ nlohmann::json::object() };
    for (const auto& [key, value] : cli.m_SettingsOverrides)
    {
        try
        {
            // Try parsing the override as a literal ...
            overrides[key] = nlohmann::json::parse(value);
        }
        catch (const nlohmann::json::parse_error&)
        {
            // ... and keep it as a string if that's not possible.
            overrides[key] = value;
        }
    }
    return overrides;
}

static nlohmann::json ReadSettingsFile(const fs::path& settings_file)
{
    std::ifstream file{ settings_file };
    if (!file)
    {
        throw ConfigurationError{ fmt::format("Could not open settings file {}", settings_file.string()) };
    }
    return nlohmann::json::parse(file);
}

int main(int argc, char** argv)
{
    std::span argv_span{ argv, static_cast<size_t>(argc) };

    const auto has_flag{
        [&argv_span](std::string_view flag)
        {
            return std::ranges::find(argv_span, flag) != argv_span.end();
        }
    };

    LogFlags log_flags{
        LogFlags::Console |
        LogFlags::DetailLocation
    };
    if (has_flag("--log-file"))
    {
        log_flags |= LogFlags::File | LogFlags::DetailTime;
    }
    if (has_flag("--verbose"))
    {
        log_flags |= LogFlags::Verbose;
    }
    Log main_log{ log_flags };

    QCoreApplication app{ argc, argv };

    const CommandLineOptions cli{ ParseCommandLine(argv_span) };
    if (cli.m_HelpDisplayed || cli.m_VersionDisplayed)
    {
        return ExitCode::Success;
    }
    if (cli.m_Invalid)
    {
        fmt::print("{}", c_HelpStr);
        return ExitCode::ConfigurationFailure;
    }

    Config config{};
    BookSettings settings{};
    BookLayout layout{};
    try
    {
        config = LoadConfig(cli.m_ConfigFile);
        settings = DefaultBookSettings(config);

        if (cli.m_SettingsFile.has_value())
        {
            LogInfo("Loading settings from {}...", cli.m_SettingsFile.value());
            LoadBookSettings(settings, ReadSettingsFile(cli.m_SettingsFile.value()));
        }
        else if (cli.m_SettingsJson.has_value())
        {
            LoadBookSettings(settings, nlohmann::json::parse(cli.m_SettingsJson.value()));
        }

        if (!cli.m_SettingsOverrides.empty())
        {
            LoadBookSettings(settings, OverridesToJson(cli));
        }

        if (cli.m_NoPdf)
        {
            settings.m_CompilePdf = false;
        }

        ValidateBookSettings(settings);

        if (cli.m_DumpSettingsFile.has_value())
        {
            const fs::path& dump_file{ cli.m_DumpSettingsFile.value() };
            std::ofstream file{ dump_file };
            if (!file)
            {
                throw ConfigurationError{ fmt::format("Could not open {} for writing", dump_file.string()) };
            }
            file << DumpBookSettings(settings).dump(4) << '\n';
        }

        layout = BuildBookLayout(settings);
    }
    catch (const ConfigurationError& e)
    {
        LogError("Configuration error: {}", e.what());
        return ExitCode::ConfigurationFailure;
    }
    catch (const nlohmann::json::exception& e)
    {
        LogError("Invalid settings json: {}", e.what());
        return ExitCode::ConfigurationFailure;
    }
    catch (const fs::filesystem_error& e)
    {
        LogError("Failed reading images: {}", e.what());
        return ExitCode::ConfigurationFailure;
    }

    if (layout.m_Pages.empty())
    {
        LogWarning("No images found in {}", settings.m_ImageDir.string());
    }
    else if (!layout.m_Skipped.empty())
    {
        LogWarning("Skipped {} of the images in {}", layout.m_Skipped.size(), settings.m_ImageDir.string());
    }

    fs::path document_path;
    try
    {
        document_path = GenerateDocument(settings, layout);
    }
    catch (const std::exception& e)
    {
        LogError("Failed writing document: {}", e.what());
        return ExitCode::DocumentFailure;
    }
    LogInfo("Successfully created {}", document_path.string());

    if (settings.m_DocumentFormat == DocumentFormat::Latex && settings.m_CompilePdf)
    {
        if (!CompileLatex(document_path, config.m_LatexBinary, config.m_LatexRuns))
        {
            LogError("Failed to create PDF");
            return ExitCode::DocumentFailure;
        }
        LogInfo("Successfully created PDF: {}", fs::path{ document_path }.replace_extension(".pdf").string());
    }

    return ExitCode::Success;
}
