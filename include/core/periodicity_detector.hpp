#pragma once

#include <string>
#include <opencv2/core.hpp>
#include "core/analysis_config.hpp"
#include "core/detector.hpp"

/**
 * @brief Frequency-domain detector for regular, synthetic-looking textures
 *
 * The intensity grid is normalized to zero mean and unit variance, Hann
 * windowed and transformed with a 2-D DFT. After suppressing DC and the lowest
 * frequencies, each power bin is whitened by the median power of its radial
 * ring. Local maxima whose whitened power exceeds peak_ratio are peaks; the
 * score is the share of non-DC energy found in the bands around the peaks.
 * Photographic noise spreads energy across rings and scores near 0, printed
 * grids and tiled textures score near 1.
 */
class PeriodicityDetector : public Detector
{
public:
    explicit PeriodicityDetector(const PeriodicitySettings &settings);

    std::string name() const override { return "periodicity"; }

    /**
     * @brief Periodicity score of an image
     * @param image Intensity grid
     * @return Peak-band energy over total non-DC energy, 0 for flat or tiny images
     */
    double score(const ImageBuffer &image) const override;

    /**
     * @brief Score a precomputed power spectrum (unshifted, DC at (0, 0))
     * @param power CV_32FC1 power spectrum
     * @return Peak-band energy share in [0, 1]
     */
    double scorePowerSpectrum(const cv::Mat &power) const;

private:
    PeriodicitySettings settings_;

    static cv::Mat powerSpectrum(const cv::Mat &normalized);
};
