#pragma once

#include <functional>
#include <random>
#include <string>
#include "core/analysis_config.hpp"
#include "core/detector.hpp"

/**
 * @brief Randomized copy-move detector
 *
 * Draws sample_count square patches at random positions and matches each one
 * against the whole image with normalized cross-correlation, ignoring matches
 * that overlap the patch's own position. The score is the best correlation
 * found. A duplicated region covering a fraction p of the valid positions is
 * missed with probability about (1 - p)^sample_count.
 */
class CloneDetector : public Detector
{
public:
    using RandomEngine = std::mt19937;

    /**
     * @brief Creates the engine used for one score() call
     */
    using RandomEngineFactory = std::function<RandomEngine()>;

    /**
     * @brief Detector seeded from settings.seed, or from std::random_device per call when unset
     */
    explicit CloneDetector(const CloneSettings &settings);

    /**
     * @brief Detector drawing its randomness from an explicit factory
     */
    CloneDetector(const CloneSettings &settings, RandomEngineFactory engine_factory);

    std::string name() const override { return "clone"; }

    /**
     * @brief Clone score of an image
     * @return Best patch correlation in [0, 1], 0 if no patch could be evaluated
     */
    double score(const ImageBuffer &image) const override;

    /**
     * @brief Clone score with a caller-owned random engine
     */
    double score(const ImageBuffer &image, RandomEngine &engine) const;

    /**
     * @brief Side of the square patch used for an image of the given size
     */
    int patchSize(int width, int height) const;

private:
    CloneSettings settings_;
    RandomEngineFactory engine_factory_;
};
