#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

/**
 * @brief Single-channel intensity grid normalized to [0, 1]
 *
 * Detectors receive an ImageBuffer by const reference and never modify it.
 * The pixel matrix is always CV_32FC1 and continuous.
 */
class ImageBuffer
{
public:
    ImageBuffer() = default;

    /**
     * @brief Build a buffer from a single-channel matrix
     * @param pixels CV_8UC1 (scaled by 1/255), CV_16UC1 (scaled by 1/65535)
     *               or CV_32FC1/CV_64FC1 (taken as already normalized, clamped to [0, 1])
     * @throws std::invalid_argument if the matrix is multi-channel or of another depth
     */
    explicit ImageBuffer(const cv::Mat &pixels);

    int width() const { return pixels_.cols; }
    int height() const { return pixels_.rows; }
    bool empty() const { return pixels_.empty(); }

    const cv::Mat &pixels() const { return pixels_; }

    /**
     * @brief Pixels resized (INTER_AREA) so the longer side is at most max_dimension
     * @return A shallow copy of pixels() when no resize is needed
     */
    cv::Mat downscaled(int max_dimension) const;

private:
    cv::Mat pixels_;
};

/**
 * @brief Embedded capture metadata tag identifiers (TIFF/EXIF IFD0 tag numbers)
 */
enum class CaptureTag : uint16_t
{
    MAKE = 271,
    MODEL = 272,
    DATETIME = 306
};

/**
 * @brief Equipment metadata read from the image container
 *
 * Absent tags are std::nullopt. is_raw_format is set by the loader when the
 * container was recognized as a raw acquisition format.
 */
struct CaptureMetadata
{
    std::optional<std::string> make;
    std::optional<std::string> model;
    std::optional<std::string> datetime;
    bool is_raw_format = false;

    void setTag(CaptureTag tag, const std::string &value);

    // Convert to string for logging/debugging
    std::string toString() const;
};
