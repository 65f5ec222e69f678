#include <pbk/layout/page_layout.hpp>

#include <fmt/format.h>

#include <pbk/errors.hpp>

std::vector<Page> LayoutPages(std::span<const PlacedImage> images,
                              Length usable_height,
                              Length spacing,
                              PagingStrategy strategy)
{
    ValidatePagingStrategy(strategy);

    const bool limit_count{ strategy.m_Policy == PagingPolicy::FixedCount };

    std::vector<Page> pages;
    Page current_page{};

    for (const PlacedImage& image : images)
    {
        const Length image_extent{ image.m_Size.y + spacing };

        if (current_page.m_Images.empty())
        {
            current_page.m_Images.push_back(image);
            current_page.m_ConsumedHeight = image_extent;
            continue;
        }

        const bool page_full{
            limit_count && current_page.m_Images.size() >= strategy.m_ImagesPerPage
        };
        const bool fits{ current_page.m_ConsumedHeight + image_extent <= usable_height + c_PackingTolerance };
        if (!page_full && fits)
        {
            current_page.m_Images.push_back(image);
            current_page.m_ConsumedHeight = current_page.m_ConsumedHeight + image_extent;
        }
        else
        {
            pages.push_back(std::move(current_page));
            current_page = Page{
                .m_Images{ image },
                .m_ConsumedHeight = image_extent,
            };
        }
    }

    if (!current_page.m_Images.empty())
    {
        pages.push_back(std::move(current_page));
    }

    return pages;
}

Size ComputeSlotSize(const PageGeometry& geometry, Length spacing, PagingStrategy strategy)
{
    ValidatePagingStrategy(strategy);

    if (strategy.m_Policy == PagingPolicy::Greedy || strategy.m_ImagesPerPage == 1)
    {
        return geometry.m_UsableSize;
    }

    // Every image is charged its height plus spacing, the last one on a page included
    const auto images_per_page{ static_cast<float>(strategy.m_ImagesPerPage) };
    const Length all_spacing{ spacing * images_per_page };
    if (all_spacing >= geometry.m_UsableSize.y)
    {
        throw ConfigurationError{
            fmt::format("Spacing of {}in leaves no room for {} images per page",
                        ToInches(spacing),
                        strategy.m_ImagesPerPage)
        };
    }

    return Size{
        geometry.m_UsableSize.x,
        (geometry.m_UsableSize.y - all_spacing) / images_per_page,
    };
}

void ValidatePagingStrategy(PagingStrategy strategy)
{
    if (strategy.m_Policy == PagingPolicy::FixedCount && strategy.m_ImagesPerPage == 0)
    {
        throw ConfigurationError{ "A fixed paging strategy needs at least one image per page" };
    }
}
