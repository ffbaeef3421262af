#pragma once

#include <string>
#include "core/analysis_config.hpp"
#include "core/image_buffer.hpp"

/**
 * @brief Outcome of the capture-provenance inspection
 */
struct ProvenanceResult
{
    bool has_raw = false; // Raw/uncompressed acquisition container
    bool exif_ok = false; // Equipment make and model present
};

/**
 * @brief Looks for evidence that an image came straight off acquisition hardware
 *
 * Pure inspection of the format identifier and the capture metadata; no I/O.
 */
class ProvenanceChecker
{
public:
    explicit ProvenanceChecker(const ProvenanceSettings &settings);

    /**
     * @brief Inspect format and metadata
     * @param format Format identifier, usually the lowercase file extension ("tiff", "jpg", "nef")
     * @param metadata Capture metadata read from the container
     * @return has_raw and exif_ok flags
     */
    ProvenanceResult check(const std::string &format, const CaptureMetadata &metadata) const;

    /**
     * @brief Check if a format identifier is a recognized raw acquisition format
     * @param format Format identifier, case-insensitive, with or without leading dot
     */
    bool isRawFormat(const std::string &format) const;

    /**
     * @brief Check if make and model are both present and non-blank
     */
    static bool hasEquipmentTags(const CaptureMetadata &metadata);

    /**
     * @brief Lowercase a format identifier and strip a leading dot
     */
    static std::string normalizeFormat(const std::string &format);

private:
    ProvenanceSettings settings_;
};
