#include "core/watermark_checker.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

WatermarkChecker::WatermarkChecker(const WatermarkSettings &settings, std::optional<ImageBuffer> stamp)
    : settings_(settings)
{
    for (auto &marker : settings_.metadata_markers)
    {
        std::transform(marker.begin(), marker.end(), marker.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
    }

    if (stamp && !stamp->empty())
    {
        cv::Mat resized;
        cv::resize(stamp->pixels(), resized, cv::Size(settings_.stamp_size, settings_.stamp_size), 0, 0,
                   cv::INTER_AREA);
        stamp_ = resized;
    }
}

bool WatermarkChecker::hasMark(const std::vector<uint8_t> &header_bytes, const ImageBuffer &image) const
{
    if (hasMetadataMark(header_bytes))
    {
        Logger::debug("Watermark: provenance marker found in metadata");
        return true;
    }
    if (hasVisibleStamp(image))
    {
        Logger::debug("Watermark: visible stamp found");
        return true;
    }
    return false;
}

bool WatermarkChecker::hasMetadataMark(const std::vector<uint8_t> &header_bytes) const
{
    const size_t length = std::min(header_bytes.size(), settings_.metadata_scan_bytes);
    std::string lowered(header_bytes.begin(), header_bytes.begin() + static_cast<std::ptrdiff_t>(length));
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    for (const auto &marker : settings_.metadata_markers)
    {
        if (!marker.empty() && lowered.find(marker) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

bool WatermarkChecker::hasVisibleStamp(const ImageBuffer &image) const
{
    return stampScore(image) > settings_.stamp_threshold;
}

double WatermarkChecker::stampScore(const ImageBuffer &image) const
{
    const int corner = settings_.corner_size;
    if (!stamp_ || image.width() < corner || image.height() < corner)
    {
        return 0.0;
    }

    try
    {
        const cv::Mat &pixels = image.pixels();
        const cv::Rect corners[] = {
            cv::Rect(0, 0, corner, corner),
            cv::Rect(image.width() - corner, 0, corner, corner)};

        double best = 0.0;
        for (const auto &roi : corners)
        {
            // A blank corner cannot carry the stamp
            cv::Scalar mean, stddev;
            cv::meanStdDev(pixels(roi), mean, stddev);
            if (stddev[0] < 1e-3)
                continue;

            cv::Mat result;
            cv::matchTemplate(pixels(roi), *stamp_, result, cv::TM_CCOEFF_NORMED);
            double min_value = 0.0;
            double max_value = 0.0;
            cv::minMaxLoc(result, &min_value, &max_value);
            best = std::max(best, max_value);
        }
        return std::min(best, 1.0);
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during stamp matching: " + std::string(e.what()));
        return 0.0;
    }
}
