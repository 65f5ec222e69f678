#pragma once

#include <vector>

#include <pbk/util.hpp>

struct BookSettings;
struct BookLayout;
struct Page;

struct ImageTransform
{
    // Top-left corner, measured from the top-left corner of the page
    Position m_Position;
    Size m_Size;
};
using ImageTransforms = std::vector<ImageTransform>;

// Images are centered horizontally and stacked downwards from the top margin
ImageTransforms ComputeTransforms(const BookLayout& layout, const Page& page);

// Writes the document into the output directory, returns the path of the written file
fs::path GenerateDocument(const BookSettings& settings, const BookLayout& layout);
