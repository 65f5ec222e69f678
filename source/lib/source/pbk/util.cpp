#include <pbk/util.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <charconv>
#include <stdexcept>
#include <string>

bool HasExtension(const fs::path& path, const std::span<const fs::path> extensions)
{
    const std::string extension{ ToLower(path.extension().string()) };
    return std::ranges::any_of(extensions,
                               [&extension](const fs::path& candidate)
                               {
                                   return ToLower(candidate.string()) == extension;
                               });
}

std::vector<fs::path> ListFiles(const fs::path& path, const std::span<const fs::path> extensions)
{
    std::vector<fs::path> files;
    ForEachFile(
        path,
        [&files](const fs::path& path)
        {
            files.push_back(path.filename());
        },
        extensions);
    return files;
}

std::string ToLower(std::string_view str)
{
    std::string lower{ str };
    std::ranges::transform(lower,
                           lower.begin(),
                           [](unsigned char c)
                           {
                               return static_cast<char>(std::tolower(c));
                           });
    return lower;
}

std::optional<float> ParseFloat(std::string_view str)
{
    std::string float_str{ str };
    std::ranges::replace(float_str, ',', '.');

    float value{};
#ifdef __clang__
    // Clang and AppleClang do not support std::from_chars overloads with floating points
    try
    {
        std::size_t consumed{ 0 };
        value = std::stof(float_str, &consumed);
        if (consumed != float_str.size())
        {
            return std::nullopt;
        }
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
#else
    const char* const begin{ float_str.data() };
    const char* const end{ float_str.data() + float_str.size() };
    const auto [ptr, error]{ std::from_chars(begin, end, value) };
    if (error != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
#endif

    if (!std::isfinite(value))
    {
        return std::nullopt;
    }

    return value;
}
