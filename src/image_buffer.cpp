#include "core/image_buffer.hpp"
#include <stdexcept>
#include <algorithm>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

ImageBuffer::ImageBuffer(const cv::Mat &pixels)
{
    if (pixels.empty())
    {
        return;
    }

    if (pixels.channels() != 1)
    {
        throw std::invalid_argument("ImageBuffer requires a single-channel matrix, got " +
                                    std::to_string(pixels.channels()) + " channels");
    }

    switch (pixels.depth())
    {
    case CV_8U:
        pixels.convertTo(pixels_, CV_32F, 1.0 / 255.0);
        break;
    case CV_16U:
        pixels.convertTo(pixels_, CV_32F, 1.0 / 65535.0);
        break;
    case CV_32F:
    case CV_64F:
        pixels.convertTo(pixels_, CV_32F);
        pixels_ = cv::max(pixels_, 0.0);
        pixels_ = cv::min(pixels_, 1.0);
        break;
    default:
        throw std::invalid_argument("Unsupported ImageBuffer depth: " + std::to_string(pixels.depth()));
    }

    if (!pixels_.isContinuous())
    {
        pixels_ = pixels_.clone();
    }
}

cv::Mat ImageBuffer::downscaled(int max_dimension) const
{
    const int longer = std::max(pixels_.rows, pixels_.cols);
    if (pixels_.empty() || max_dimension <= 0 || longer <= max_dimension)
    {
        return pixels_;
    }

    const double scale = static_cast<double>(max_dimension) / longer;
    const int new_cols = std::max(1, static_cast<int>(pixels_.cols * scale));
    const int new_rows = std::max(1, static_cast<int>(pixels_.rows * scale));

    cv::Mat resized;
    cv::resize(pixels_, resized, cv::Size(new_cols, new_rows), 0, 0, cv::INTER_AREA);
    return resized;
}

void CaptureMetadata::setTag(CaptureTag tag, const std::string &value)
{
    switch (tag)
    {
    case CaptureTag::MAKE:
        make = value;
        break;
    case CaptureTag::MODEL:
        model = value;
        break;
    case CaptureTag::DATETIME:
        datetime = value;
        break;
    }
}

std::string CaptureMetadata::toString() const
{
    auto show = [](const std::optional<std::string> &value)
    {
        return value ? "\"" + *value + "\"" : std::string("<absent>");
    };

    return "make=" + show(make) + ", model=" + show(model) + ", datetime=" + show(datetime) +
           ", raw=" + (is_raw_format ? "yes" : "no");
}
