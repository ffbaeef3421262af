#include "core/image_analyzer.hpp"
#include "core/clone_detector.hpp"
#include "core/periodicity_detector.hpp"
#include "logging/logger.hpp"
#include <stdexcept>
#include <utility>

const AnalysisConfig &ImageAnalyzer::validated(const AnalysisConfig &config)
{
    config.validate();
    return config;
}

ImageAnalyzer::ImageAnalyzer(const AnalysisConfig &config, std::optional<ImageBuffer> stamp)
    : config_(validated(config)),
      provenance_checker_(config_.provenance),
      watermark_checker_(config_.watermark, std::move(stamp)),
      aggregator_(config_.risk)
{
    detectors_.push_back(std::make_unique<PeriodicityDetector>(config_.periodicity));
    detectors_.push_back(std::make_unique<CloneDetector>(config_.clone));

    Logger::debug("ImageAnalyzer initialized with " + std::to_string(detectors_.size()) + " detectors, clone samples: " +
                  std::to_string(config_.clone.sample_count) +
                  (config_.clone.seed ? ", seed: " + std::to_string(*config_.clone.seed) : ", unseeded"));
}

void ImageAnalyzer::addDetector(std::unique_ptr<Detector> detector, const RiskRule &rule)
{
    if (!detector)
    {
        throw std::invalid_argument("ImageAnalyzer::addDetector called with a null detector");
    }

    Logger::info("Registering detector: " + detector->name() + " (weight " + std::to_string(rule.weight) + ")");
    detectors_.push_back(std::move(detector));
    aggregator_.addRule(rule);
}

std::map<std::string, double> ImageAnalyzer::detectorScores(const ImageBuffer &image) const
{
    std::map<std::string, double> scores;
    for (const auto &detector : detectors_)
    {
        scores[detector->name()] = detector->score(image);
    }
    return scores;
}

CheckResult ImageAnalyzer::runChecks(const AnalysisInput &input) const
{
    if (input.image.empty())
    {
        throw std::invalid_argument("ImageAnalyzer cannot analyze an empty image buffer");
    }

    CheckResult checks;

    const ProvenanceResult provenance = provenance_checker_.check(input.format, input.metadata);
    checks.has_raw = provenance.has_raw;
    checks.exif_ok = provenance.exif_ok;

    for (const auto &[name, value] : detectorScores(input.image))
    {
        if (name == "clone")
            checks.clone_score = value;
        else if (name == "periodicity")
            checks.periodicity_score = value;
        else
            checks.extra_scores[name] = value;
    }

    checks.ai_declared = input.ai_declared;
    checks.mark_present = watermark_checker_.hasMark(input.header_bytes, input.image);

    return checks;
}

VerdictRecord ImageAnalyzer::analyze(const AnalysisInput &input) const
{
    return aggregator_.aggregate(runChecks(input));
}
