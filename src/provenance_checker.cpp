#include "core/provenance_checker.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>

namespace
{
    bool isPresentAndNonBlank(const std::optional<std::string> &value)
    {
        if (!value)
            return false;
        return std::any_of(value->begin(), value->end(), [](unsigned char c)
                           { return !std::isspace(c) && c != '\0'; });
    }
}

ProvenanceChecker::ProvenanceChecker(const ProvenanceSettings &settings)
    : settings_(settings)
{
    for (auto &format : settings_.raw_formats)
    {
        format = normalizeFormat(format);
    }
}

ProvenanceResult ProvenanceChecker::check(const std::string &format, const CaptureMetadata &metadata) const
{
    ProvenanceResult result;
    result.has_raw = isRawFormat(format) || metadata.is_raw_format;
    result.exif_ok = hasEquipmentTags(metadata);

    Logger::debug("Provenance for format '" + format + "' (" + metadata.toString() + "): has_raw=" +
                  (result.has_raw ? "true" : "false") + ", exif_ok=" + (result.exif_ok ? "true" : "false"));
    return result;
}

bool ProvenanceChecker::isRawFormat(const std::string &format) const
{
    const std::string normalized = normalizeFormat(format);
    if (normalized.empty())
        return false;
    return std::find(settings_.raw_formats.begin(), settings_.raw_formats.end(), normalized) !=
           settings_.raw_formats.end();
}

bool ProvenanceChecker::hasEquipmentTags(const CaptureMetadata &metadata)
{
    // DateTime is supportive only
    return isPresentAndNonBlank(metadata.make) && isPresentAndNonBlank(metadata.model);
}

std::string ProvenanceChecker::normalizeFormat(const std::string &format)
{
    std::string normalized = format;
    if (!normalized.empty() && normalized.front() == '.')
    {
        normalized.erase(0, 1);
    }
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return normalized;
}
