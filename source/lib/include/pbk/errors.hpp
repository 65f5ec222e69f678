#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <pbk/util.hpp>

// Bad configuration or settings, nothing is laid out when this is thrown
class ConfigurationError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

class InvalidImageDimensions : public std::runtime_error
{
  public:
    InvalidImageDimensions(const std::string& what, PixelSize pixel_size)
        : std::runtime_error{ what }
        , m_PixelSize{ pixel_size }
    {
    }

    PixelSize m_PixelSize;
};

class UnreadableImage : public std::runtime_error
{
  public:
    UnreadableImage(const std::string& what, fs::path image_path)
        : std::runtime_error{ what }
        , m_ImagePath{ std::move(image_path) }
    {
    }

    fs::path m_ImagePath;
};
