#pragma once

#include <string>
#include "core/image_buffer.hpp"

/**
 * @brief Interface of a pixel-based authenticity detector
 *
 * score() must be safe to call concurrently on the same instance and must not
 * throw for valid-but-degenerate input: such images score 0.
 */
class Detector
{
public:
    virtual ~Detector() = default;

    /**
     * @brief Name used as the key of the score in the analysis (e.g. "clone")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Score an image
     * @param image Read-only intensity grid
     * @return Score in [0, 1], higher meaning more suspicious
     */
    virtual double score(const ImageBuffer &image) const = 0;
};
