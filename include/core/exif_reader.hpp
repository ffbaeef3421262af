#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/image_buffer.hpp"

/**
 * @brief Minimal reader for the IFD0 equipment tags of TIFF, JPEG and PNG files
 *
 * Only Make (271), Model (272) and DateTime (306) are extracted. Supported
 * carriers: a bare TIFF stream ("II*\0" / "MM\0*"), the JPEG APP1 "Exif"
 * segment and the PNG eXIf chunk. Malformed data yields absent tags, never an
 * exception.
 */
class ExifReader
{
public:
    /**
     * @brief Read the equipment tags from complete file contents
     * @param bytes File contents
     * @return Metadata with the tags found; is_raw_format is left false
     */
    static CaptureMetadata readTags(const std::vector<uint8_t> &bytes);

    /**
     * @brief Locate the TIFF stream carrying the EXIF tags
     * @return Offset and length of the TIFF stream inside bytes, if any
     */
    static std::optional<std::pair<size_t, size_t>> findTiffStream(const std::vector<uint8_t> &bytes);

    /**
     * @brief Read the equipment tags from IFD0 of a TIFF stream
     */
    static CaptureMetadata parseTiff(const uint8_t *data, size_t size);

    /**
     * @brief Check for the TIFF header ("II*\0" or "MM\0*")
     */
    static bool isTiffHeader(const uint8_t *data, size_t size);

private:
    static std::optional<std::pair<size_t, size_t>> findJpegExif(const std::vector<uint8_t> &bytes);
    static std::optional<std::pair<size_t, size_t>> findPngExif(const std::vector<uint8_t> &bytes);
};
