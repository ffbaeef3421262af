#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/analysis_config.hpp"
#include "core/check_result.hpp"
#include "core/detector.hpp"
#include "core/image_buffer.hpp"
#include "core/provenance_checker.hpp"
#include "core/risk_aggregator.hpp"
#include "core/watermark_checker.hpp"

/**
 * @brief Everything the pipeline needs to know about one decoded image
 */
struct AnalysisInput
{
    ImageBuffer image;
    CaptureMetadata metadata;
    std::string format;                // Format identifier (lowercase extension)
    std::vector<uint8_t> header_bytes; // Leading file bytes for the metadata mark scan
    bool ai_declared = false;          // Uploader declared digital generation
};

/**
 * @brief Per-image authenticity pipeline
 *
 * The configuration is validated on construction, so a ConfigurationError is
 * raised before any detector runs. After that, analysis is total: every
 * non-empty buffer yields a VerdictRecord. analyze() is const and keeps no
 * per-call state, so one analyzer can serve several threads.
 */
class ImageAnalyzer
{
public:
    /**
     * @brief Analyzer with the built-in periodicity and clone detectors
     * @param config Analysis configuration
     * @param stamp Visible watermark stamp template, if any
     * @throws ConfigurationError if config is invalid
     */
    explicit ImageAnalyzer(const AnalysisConfig &config, std::optional<ImageBuffer> stamp = std::nullopt);

    /**
     * @brief Register an extra detector together with the rule that weighs its score
     *
     * The detector's score lands in CheckResult::extra_scores under its name.
     */
    void addDetector(std::unique_ptr<Detector> detector, const RiskRule &rule);

    /**
     * @brief Run every detector and the provenance and watermark checks
     * @throws std::invalid_argument for an empty image buffer
     */
    CheckResult runChecks(const AnalysisInput &input) const;

    /**
     * @brief Run the checks and aggregate them into a verdict
     * @throws std::invalid_argument for an empty image buffer
     */
    VerdictRecord analyze(const AnalysisInput &input) const;

    /**
     * @brief Scores of all registered detectors keyed by detector name
     */
    std::map<std::string, double> detectorScores(const ImageBuffer &image) const;

    const AnalysisConfig &config() const { return config_; }
    const RiskAggregator &aggregator() const { return aggregator_; }

private:
    AnalysisConfig config_;
    std::vector<std::unique_ptr<Detector>> detectors_;
    ProvenanceChecker provenance_checker_;
    WatermarkChecker watermark_checker_;
    RiskAggregator aggregator_;

    static const AnalysisConfig &validated(const AnalysisConfig &config);
};
