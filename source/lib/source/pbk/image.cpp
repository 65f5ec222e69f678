#include <pbk/image.hpp>

#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/imgcodecs.hpp>

Image::Image(cv::Mat impl)
    : m_Impl{ std::move(impl) }
{
}

Image::Image(const Image& rhs)
    : m_Impl{ rhs.m_Impl.clone() }
{
}

Image& Image::operator=(const Image& rhs)
{
    m_Impl = rhs.m_Impl.clone();
    return *this;
}

Image Image::Read(const fs::path& path)
{
    Image img{};
    try
    {
        img.m_Impl = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception&)
    {
        // OpenCV throws for some corrupted files instead of returning an empty image
        img.m_Impl = cv::Mat{};
    }
    return img;
}

bool Image::Write(const fs::path& path, std::optional<int32_t> jpg_quality) const
{
    const std::string ext{ ToLower(path.extension().string()) };
    if ((ext == ".jpg" || ext == ".jpeg") && jpg_quality.has_value())
    {
        const std::vector<int> jpg_params{
            cv::IMWRITE_JPEG_QUALITY,
            jpg_quality.value(),
        };
        return cv::imwrite(path.string(), m_Impl, jpg_params);
    }

    return cv::imwrite(path.string(), m_Impl);
}

EncodedImage Image::EncodePng(std::optional<int32_t> compression) const
{
    std::vector<int> png_params;
    if (compression.has_value())
    {
        png_params = {
            cv::IMWRITE_PNG_COMPRESSION,
            compression.value(),
        };
    }

    std::vector<uchar> buf;
    if (!cv::imencode(".png", m_Impl, buf, png_params))
    {
        return {};
    }

    EncodedImage encoded(buf.size());
    std::memcpy(encoded.data(), buf.data(), buf.size());
    return encoded;
}

Image::operator bool() const
{
    return Valid();
}

bool Image::Valid() const
{
    return !m_Impl.empty();
}

Pixel Image::Width() const
{
    return static_cast<float>(m_Impl.cols) * 1_pix;
}

Pixel Image::Height() const
{
    return static_cast<float>(m_Impl.rows) * 1_pix;
}

PixelSize Image::Size() const
{
    return { Width(), Height() };
}
