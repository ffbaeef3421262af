#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Thrown when a caller supplies an invalid analysis configuration
 */
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string &message)
        : std::runtime_error("Invalid configuration: " + message) {}
};

struct PeriodicitySettings
{
    int max_dimension = 512;           // Longer side is downscaled to this before the DFT
    int min_dimension = 16;            // Shorter sides below this score 0
    double dc_exclusion_radius = 0.04; // Radial frequency (cycles/pixel) suppressed around DC
    double peak_ratio = 16.0;          // Whitened power a bin must exceed to count as a peak
    int peak_radius = 2;               // Half-width of the band summed around each peak
};

struct CloneSettings
{
    int sample_count = 12;
    int max_dimension = 512;
    double patch_fraction = 0.08; // Patch side relative to the shorter image side
    int min_patch_size = 16;
    int guard_margin = 8;            // Added to the patch size to form the self-match guard
    int border_margin = 4;           // Minimum distance between a candidate patch and the edge
    double min_patch_stddev = 0.01;  // Flatter candidates are skipped
    std::optional<uint32_t> seed;    // Unset: every call draws a fresh seed
};

struct ProvenanceSettings
{
    std::vector<std::string> raw_formats = {"tif", "tiff", "dng", "nef", "cr2", "arw",
                                            "orf", "pef", "rw2", "raf", "srw"};
};

struct WatermarkSettings
{
    std::vector<std::string> metadata_markers = {"c2pa", "xmpmeta", "contentcredentials", "aiprovenance"};
    size_t metadata_scan_bytes = 256 * 1024;
    std::string stamp_path = "assets/digital_stamp.png";
    int stamp_size = 48;     // Stamp is resized to stamp_size x stamp_size
    int corner_size = 96;    // Top-left and top-right corner windows searched for the stamp
    double stamp_threshold = 0.85;
};

struct RiskSettings
{
    double periodicity_threshold = 0.25;
    double clone_threshold = 0.98;
    int periodicity_weight = 30;
    int clone_weight = 40;
    int provenance_weight = 40;
    int undeclared_mark_weight = 50;
    int pass_max_risk = 25;
    int declared_compliant_risk = 10;
    int declared_violation_risk = 100;
};

/**
 * @brief Explicit configuration for one analysis run
 *
 * Passed by value into the detectors and the aggregator. Nothing reads
 * process-wide state, so tests can vary any threshold locally.
 */
struct AnalysisConfig
{
    static constexpr int MAX_ANALYSIS_THREADS = 64;

    PeriodicitySettings periodicity;
    CloneSettings clone;
    ProvenanceSettings provenance;
    WatermarkSettings watermark;
    RiskSettings risk;
    int max_analysis_threads = 4;

    /**
     * @brief Check every field
     * @throws ConfigurationError naming the first invalid field
     */
    void validate() const;
};
