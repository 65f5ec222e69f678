#include <pbk/book/image_provider.hpp>

#include <algorithm>
#include <array>
#include <system_error>

#include <fmt/format.h>

#include <pbk/errors.hpp>
#include <pbk/image.hpp>
#include <pbk/util/log.hpp>

std::span<const fs::path> ImageExtensions()
{
    static const std::array<fs::path, 4> c_ImageExtensions{
        ".jpg"_p,
        ".jpeg"_p,
        ".png"_p,
        ".bmp"_p,
    };
    return c_ImageExtensions;
}

static fs::file_time_type TryGetLastWriteTime(const fs::path& file_path)
{
    std::error_code error;
    const auto last_write_time{ fs::last_write_time(file_path, error) };
    if (error)
    {
        LogError("Failed getting last write time of {}: {}", file_path.string(), error.message());
        return {};
    }
    return last_write_time;
}

std::vector<fs::path> ListImageFiles(const fs::path& image_dir)
{
    if (!fs::is_directory(image_dir))
    {
        throw ConfigurationError{
            fmt::format("Image directory {} does not exist", image_dir.string())
        };
    }

    std::vector<fs::path> files{ ListFiles(image_dir, ImageExtensions()) };
    std::ranges::sort(files);
    for (fs::path& file : files)
    {
        file = image_dir / file;
    }
    return files;
}

ImageInfo ReadImageInfo(const fs::path& image_path)
{
    const Image image{ Image::Read(image_path) };
    if (!image)
    {
        throw UnreadableImage{
            fmt::format("Could not decode image {}", image_path.string()),
            image_path,
        };
    }

    return ImageInfo{
        .m_Name = image_path.filename(),
        .m_Path = image_path,
        .m_PixelSize = image.Size(),
        .m_LastWriteTime = TryGetLastWriteTime(image_path),
    };
}

std::vector<ImageInfo> ReadImageInfos(const fs::path& image_dir, std::vector<SkippedImage>& skipped)
{
    const std::vector<fs::path> files{ ListImageFiles(image_dir) };
    LogInfo("Reading {} images from {}...", files.size(), image_dir.string());

    std::vector<ImageInfo> images;
    images.reserve(files.size());
    for (const fs::path& file : files)
    {
        try
        {
            images.push_back(ReadImageInfo(file));
        }
        catch (const UnreadableImage& e)
        {
            LogWarning("Skipping {}: {}", file.filename().string(), e.what());
            skipped.push_back({ file.filename(), e.what() });
        }
    }
    return images;
}
