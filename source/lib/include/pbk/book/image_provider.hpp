#pragma once

#include <span>
#include <string>
#include <vector>

#include <pbk/layout/image_info.hpp>
#include <pbk/util.hpp>

struct SkippedImage
{
    fs::path m_Name;
    std::string m_Reason;
};

std::span<const fs::path> ImageExtensions();

// Full paths of all images in image_dir, sorted by file name
std::vector<fs::path> ListImageFiles(const fs::path& image_dir);

// Throws UnreadableImage if the file can not be decoded
ImageInfo ReadImageInfo(const fs::path& image_path);

// Reads all images in image_dir, unreadable images are reported in skipped and left out
std::vector<ImageInfo> ReadImageInfos(const fs::path& image_dir, std::vector<SkippedImage>& skipped);
