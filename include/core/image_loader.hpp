#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/image_analyzer.hpp"
#include "core/image_buffer.hpp"

/**
 * @brief Result of loading one image file
 */
struct LoadResult
{
    bool success;
    std::string error_message;
    AnalysisInput input;

    LoadResult() : success(false) {}
    LoadResult(bool s, const std::string &msg = "")
        : success(s), error_message(msg) {}
};

/**
 * @brief Decodes image files into the grayscale buffer and capture metadata the analyzer consumes
 *
 * Common formats (TIFF, PNG, JPEG) are decoded with OpenCV and their EXIF
 * equipment tags read from the container. Camera raw formats are developed
 * with LibRaw, which also supplies make, model and timestamp.
 */
class ImageLoader
{
public:
    /**
     * @param header_scan_bytes Number of leading file bytes kept for the metadata mark scan
     */
    explicit ImageLoader(size_t header_scan_bytes = 256 * 1024);

    /**
     * @brief Load and decode a file
     * @return LoadResult with success == false and an error message when the file cannot be read or decoded
     */
    LoadResult load(const std::string &file_path) const;

    /**
     * @brief Decode in-memory file contents
     * @param bytes Complete file contents
     * @param format Lowercase extension used as the format identifier
     */
    LoadResult decode(const std::vector<uint8_t> &bytes, const std::string &format) const;

    /**
     * @brief Load the visible watermark stamp template
     * @return std::nullopt (with a warning) if the file is missing or unreadable
     */
    static std::optional<ImageBuffer> loadStamp(const std::string &path);

    /**
     * @brief Extensions accepted by the batch scanner (lowercase, no dot)
     */
    static const std::vector<std::string> &supportedExtensions();

    static bool isCameraRawFormat(const std::string &format);

private:
    size_t header_scan_bytes_;

    static bool decodeCameraRaw(const std::vector<uint8_t> &bytes, cv::Mat &gray, CaptureMetadata &metadata,
                                std::string &error);
    static cv::Mat decodeWithOpenCV(const std::vector<uint8_t> &bytes);
};
