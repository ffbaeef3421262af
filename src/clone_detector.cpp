#include "core/clone_detector.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace
{
    constexpr double kMinStdDev = 1e-6;

    // Marks match positions whose window is too flat for a meaningful correlation.
    // TM_CCOEFF_NORMED divides by the window deviation, so near-constant windows
    // produce arbitrary values (including 1.0) from rounding noise.
    cv::Mat flatWindowMask(const cv::Mat &gray, int patch, double min_stddev)
    {
        cv::Mat sum, sqsum;
        cv::integral(gray, sum, sqsum, CV_64F, CV_64F);

        const int result_rows = gray.rows - patch + 1;
        const int result_cols = gray.cols - patch + 1;
        const double area = static_cast<double>(patch) * patch;
        const double min_variance = min_stddev * min_stddev;

        cv::Mat mask(result_rows, result_cols, CV_8U, cv::Scalar(0));
        for (int y = 0; y < result_rows; ++y)
        {
            for (int x = 0; x < result_cols; ++x)
            {
                const double s = sum.at<double>(y + patch, x + patch) - sum.at<double>(y, x + patch) -
                                 sum.at<double>(y + patch, x) + sum.at<double>(y, x);
                const double sq = sqsum.at<double>(y + patch, x + patch) - sqsum.at<double>(y, x + patch) -
                                  sqsum.at<double>(y + patch, x) + sqsum.at<double>(y, x);
                const double mean = s / area;
                const double variance = sq / area - mean * mean;
                if (variance <= min_variance)
                {
                    mask.at<uint8_t>(y, x) = 255;
                }
            }
        }
        return mask;
    }
}

CloneDetector::CloneDetector(const CloneSettings &settings)
    : settings_(settings)
{
    if (settings_.seed)
    {
        const uint32_t seed = *settings_.seed;
        engine_factory_ = [seed]()
        {
            return RandomEngine(seed);
        };
    }
    else
    {
        engine_factory_ = []()
        {
            std::random_device device;
            return RandomEngine(device());
        };
    }
}

CloneDetector::CloneDetector(const CloneSettings &settings, RandomEngineFactory engine_factory)
    : settings_(settings), engine_factory_(std::move(engine_factory))
{
}

int CloneDetector::patchSize(int width, int height) const
{
    const int shorter = std::min(width, height);
    const int relative = static_cast<int>(std::lround(shorter * settings_.patch_fraction));
    return std::max(settings_.min_patch_size, relative);
}

double CloneDetector::score(const ImageBuffer &image) const
{
    RandomEngine engine = engine_factory_();
    return score(image, engine);
}

double CloneDetector::score(const ImageBuffer &image, RandomEngine &engine) const
{
    if (image.empty())
    {
        Logger::debug("Clone: empty image, score 0");
        return 0.0;
    }

    try
    {
        cv::Mat gray = image.downscaled(settings_.max_dimension);

        cv::Scalar mean, stddev;
        cv::meanStdDev(gray, mean, stddev);
        if (stddev[0] < kMinStdDev)
        {
            Logger::debug("Clone: zero-variance image, score 0");
            return 0.0;
        }

        const int patch = patchSize(gray.cols, gray.rows);
        const int guard = patch + settings_.guard_margin;
        const int min_x = settings_.border_margin;
        const int min_y = settings_.border_margin;
        const int max_x = gray.cols - patch - settings_.border_margin;
        const int max_y = gray.rows - patch - settings_.border_margin;

        if (max_x < min_x || max_y < min_y)
        {
            Logger::debug("Clone: image " + std::to_string(gray.cols) + "x" + std::to_string(gray.rows) +
                          " too small for " + std::to_string(patch) + "px patches, score 0");
            return 0.0;
        }

        // Every draw is made even for skipped patches so a seed fixes the whole sequence
        std::uniform_int_distribution<int> pick_x(min_x, max_x);
        std::uniform_int_distribution<int> pick_y(min_y, max_y);

        cv::Mat flat_windows = flatWindowMask(gray, patch, settings_.min_patch_stddev);

        double best = 0.0;
        int evaluated = 0;
        for (int i = 0; i < settings_.sample_count; ++i)
        {
            const int x = pick_x(engine);
            const int y = pick_y(engine);

            if (flat_windows.at<uint8_t>(y, x))
            {
                Logger::trace("Clone: skipping flat patch at (" + std::to_string(x) + ", " + std::to_string(y) + ")");
                continue;
            }

            cv::Mat result;
            cv::matchTemplate(gray, gray(cv::Rect(x, y, patch, patch)), result, cv::TM_CCOEFF_NORMED);
            result.setTo(-1.0, flat_windows);

            // Positions overlapping the patch itself would trivially match
            const int x0 = std::max(0, x - guard + 1);
            const int y0 = std::max(0, y - guard + 1);
            const int x1 = std::min(result.cols, x + guard);
            const int y1 = std::min(result.rows, y + guard);
            result(cv::Rect(x0, y0, x1 - x0, y1 - y0)).setTo(-1.0);

            double min_value = 0.0;
            double max_value = 0.0;
            cv::minMaxLoc(result, &min_value, &max_value);
            best = std::max(best, max_value);
            ++evaluated;
        }

        if (evaluated == 0)
        {
            Logger::debug("Clone: no textured patch among " + std::to_string(settings_.sample_count) +
                          " samples, score 0");
            return 0.0;
        }

        double result = std::clamp(best, 0.0, 1.0);
        Logger::debug("Clone score: " + std::to_string(result) + " over " + std::to_string(evaluated) + " patches");
        return result;
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during clone analysis: " + std::string(e.what()));
        return 0.0;
    }
}
