#pragma once

#include <vector>

#include <pbk/layout/image_info.hpp>

enum class ImageOrder
{
    LastModified,
    Alphabetical,
};

enum class ImageOrderDirection
{
    Ascending,
    Descending,
};

// Stable, images with equal keys keep their relative input order
std::vector<ImageInfo> OrderImages(std::vector<ImageInfo> images,
                                   ImageOrder order = ImageOrder::LastModified,
                                   ImageOrderDirection direction = ImageOrderDirection::Ascending);
