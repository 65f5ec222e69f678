#include <pbk/layout/image_order.hpp>

#include <algorithm>
#include <functional>
#include <utility>

static std::function<bool(const ImageInfo&, const ImageInfo&)> GetSortFunction(ImageOrder order,
                                                                              ImageOrderDirection direction)
{
    switch (order)
    {
    case ImageOrder::LastModified:
        switch (direction)
        {
        case ImageOrderDirection::Ascending:
            return [](const ImageInfo& lhs, const ImageInfo& rhs)
            {
                return lhs.m_LastWriteTime < rhs.m_LastWriteTime;
            };
        case ImageOrderDirection::Descending:
            return [](const ImageInfo& lhs, const ImageInfo& rhs)
            {
                return lhs.m_LastWriteTime > rhs.m_LastWriteTime;
            };
        }
        std::unreachable();
    case ImageOrder::Alphabetical:
        switch (direction)
        {
        case ImageOrderDirection::Ascending:
            return [](const ImageInfo& lhs, const ImageInfo& rhs)
            {
                return lhs.m_Name < rhs.m_Name;
            };
        case ImageOrderDirection::Descending:
            return [](const ImageInfo& lhs, const ImageInfo& rhs)
            {
                return lhs.m_Name > rhs.m_Name;
            };
        }
    }
    std::unreachable();
}

std::vector<ImageInfo> OrderImages(std::vector<ImageInfo> images,
                                   ImageOrder order,
                                   ImageOrderDirection direction)
{
    std::ranges::stable_sort(images, GetSortFunction(order, direction));
    return images;
}
