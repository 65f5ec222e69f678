#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <opencv2/core/mat.hpp>

#include <pbk/util.hpp>

using EncodedImage = std::vector<std::byte>;

class [[nodiscard]] Image
{
  public:
    Image() = default;
    Image(cv::Mat impl);
    ~Image() = default;

    Image(Image&& rhs) = default;
    Image(const Image& rhs);

    Image& operator=(Image&& rhs) = default;
    Image& operator=(const Image& rhs);

    static Image Read(const fs::path& path);
    bool Write(const fs::path& path, std::optional<int32_t> jpg_quality = std::nullopt) const;

    EncodedImage EncodePng(std::optional<int32_t> compression = std::nullopt) const;

    explicit operator bool() const;
    bool Valid() const;

    Pixel Width() const;
    Pixel Height() const;
    PixelSize Size() const;

  private:
    cv::Mat m_Impl{};
};
