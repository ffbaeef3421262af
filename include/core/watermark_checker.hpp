#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "core/analysis_config.hpp"
#include "core/image_buffer.hpp"

/**
 * @brief Detects the marks required on declared digitally generated images
 *
 * Two kinds of mark are accepted: a provenance marker (C2PA, XMP, content
 * credentials) in the leading bytes of the file, or the visible stamp in the
 * top-left or top-right corner of the image.
 */
class WatermarkChecker
{
public:
    /**
     * @param settings Marker list and stamp geometry
     * @param stamp Stamp template; without it only metadata marks are detected
     */
    WatermarkChecker(const WatermarkSettings &settings, std::optional<ImageBuffer> stamp);

    /**
     * @brief Check both kinds of mark
     * @param header_bytes Leading bytes of the image file
     * @param image Decoded intensity grid
     */
    bool hasMark(const std::vector<uint8_t> &header_bytes, const ImageBuffer &image) const;

    /**
     * @brief Case-insensitive search for any provenance marker in the first metadata_scan_bytes bytes
     */
    bool hasMetadataMark(const std::vector<uint8_t> &header_bytes) const;

    /**
     * @brief Template-match the stamp inside the two top corners
     * @return false when no stamp is configured or the image is smaller than the corner window
     */
    bool hasVisibleStamp(const ImageBuffer &image) const;

    /**
     * @brief Best stamp correlation over both corners, 0 when not applicable
     */
    double stampScore(const ImageBuffer &image) const;

    bool hasStamp() const { return stamp_.has_value(); }

private:
    WatermarkSettings settings_;
    std::optional<cv::Mat> stamp_; // Resized to stamp_size x stamp_size
};
