#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <pbk/layout/page_geometry.hpp>
#include <pbk/util.hpp>

struct PlacedImage
{
    fs::path m_Name;
    fs::path m_Path;
    Size m_Size;
    float m_Scale;

    bool operator==(const PlacedImage&) const = default;
};

struct Page
{
    std::vector<PlacedImage> m_Images;

    // Sum of image height and spacing of all images on the page
    Length m_ConsumedHeight{ 0_mm };

    bool operator==(const Page&) const = default;
};

enum class PagingPolicy
{
    // As many images per page as fit
    Greedy,
    // At most m_ImagesPerPage images per page, as many as fit
    FixedCount,
};

struct PagingStrategy
{
    PagingPolicy m_Policy{ PagingPolicy::Greedy };
    uint32_t m_ImagesPerPage{ 0 };

    bool operator==(const PagingStrategy&) const = default;
};

inline constexpr PagingStrategy c_GreedyPaging{};
inline constexpr PagingStrategy FixedCountPaging(uint32_t images_per_page)
{
    return PagingStrategy{ PagingPolicy::FixedCount, images_per_page };
}

// Absorbs float rounding when a page is filled exactly, e.g. by images sized into slots
inline constexpr Length c_PackingTolerance{ 0.0001_in };

/*
        Single pass greedy vertical packing, images are never reordered, dropped or split.
        Each image consumes its height plus spacing, an image fits if the consumed height
        stays within usable_height + c_PackingTolerance. An image that does not fit onto
        the current page starts a new one, an empty page takes any image, no matter its size.
*/
std::vector<Page> LayoutPages(std::span<const PlacedImage> images,
                              Length usable_height,
                              Length spacing,
                              PagingStrategy strategy = c_GreedyPaging);

// The area a single image is sized into, so that a full page holds the images the strategy asks for,
// for FixedCount(n) that is the usable width by (usable height - n * spacing) / n
Size ComputeSlotSize(const PageGeometry& geometry, Length spacing, PagingStrategy strategy);

void ValidatePagingStrategy(PagingStrategy strategy);
