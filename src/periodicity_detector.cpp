#include "core/periodicity_detector.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace
{
    constexpr double kMinStdDev = 1e-6;
}

PeriodicityDetector::PeriodicityDetector(const PeriodicitySettings &settings)
    : settings_(settings)
{
}

double PeriodicityDetector::score(const ImageBuffer &image) const
{
    if (image.empty())
    {
        Logger::debug("Periodicity: empty image, score 0");
        return 0.0;
    }

    try
    {
        cv::Mat gray = image.downscaled(settings_.max_dimension);
        if (std::min(gray.rows, gray.cols) < settings_.min_dimension)
        {
            Logger::debug("Periodicity: image " + std::to_string(gray.cols) + "x" + std::to_string(gray.rows) +
                          " below minimum dimension, score 0");
            return 0.0;
        }

        // Zero mean, unit variance: brightness and contrast scaling cancel out here
        cv::Scalar mean, stddev;
        cv::meanStdDev(gray, mean, stddev);
        if (stddev[0] < kMinStdDev)
        {
            Logger::debug("Periodicity: zero-variance image, score 0");
            return 0.0;
        }

        cv::Mat normalized;
        gray.convertTo(normalized, CV_32F, 1.0 / stddev[0], -mean[0] / stddev[0]);

        double result = scorePowerSpectrum(powerSpectrum(normalized));
        Logger::debug("Periodicity score: " + std::to_string(result));
        return result;
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV error during periodicity analysis: " + std::string(e.what()));
        return 0.0;
    }
}

cv::Mat PeriodicityDetector::powerSpectrum(const cv::Mat &normalized)
{
    // Hann window removes the cross-shaped leakage of the image borders
    cv::Mat window;
    cv::createHanningWindow(window, normalized.size(), CV_32F);
    cv::Mat windowed = normalized.mul(window);

    const int dft_rows = cv::getOptimalDFTSize(windowed.rows);
    const int dft_cols = cv::getOptimalDFTSize(windowed.cols);
    cv::Mat padded;
    cv::copyMakeBorder(windowed, padded, 0, dft_rows - windowed.rows, 0, dft_cols - windowed.cols,
                       cv::BORDER_CONSTANT, cv::Scalar::all(0));

    cv::Mat spectrum;
    cv::dft(padded, spectrum, cv::DFT_COMPLEX_OUTPUT);

    cv::Mat planes[2];
    cv::split(spectrum, planes);
    cv::Mat magnitude;
    cv::magnitude(planes[0], planes[1], magnitude);
    return magnitude.mul(magnitude);
}

double PeriodicityDetector::scorePowerSpectrum(const cv::Mat &power) const
{
    const int rows = power.rows;
    const int cols = power.cols;
    if (rows < 3 || cols < 3)
    {
        return 0.0;
    }

    const int ring_scale = std::min(rows, cols);
    cv::Mat ring_index(rows, cols, CV_32S);
    cv::Mat excluded(rows, cols, CV_8U, cv::Scalar(0));

    // Radial frequency of every bin in cycles/pixel, DC at (0, 0) with wraparound
    int ring_count = 0;
    for (int y = 0; y < rows; ++y)
    {
        const double fy = static_cast<double>(std::min(y, rows - y)) / rows;
        for (int x = 0; x < cols; ++x)
        {
            const double fx = static_cast<double>(std::min(x, cols - x)) / cols;
            const double radius = std::sqrt(fx * fx + fy * fy);
            const int ring = static_cast<int>(radius * ring_scale);
            ring_index.at<int>(y, x) = ring;
            ring_count = std::max(ring_count, ring + 1);

            if ((x == 0 && y == 0) || radius < settings_.dc_exclusion_radius)
            {
                excluded.at<uint8_t>(y, x) = 1;
            }
        }
    }

    std::vector<std::vector<float>> ring_values(ring_count);
    double total_energy = 0.0;
    size_t counted_bins = 0;
    for (int y = 0; y < rows; ++y)
    {
        for (int x = 0; x < cols; ++x)
        {
            if (excluded.at<uint8_t>(y, x))
                continue;
            const float value = power.at<float>(y, x);
            ring_values[ring_index.at<int>(y, x)].push_back(value);
            total_energy += value;
            ++counted_bins;
        }
    }

    if (counted_bins == 0 || total_energy <= 0.0)
    {
        return 0.0;
    }

    // Median power per ring is the background the peaks are measured against
    const double floor = total_energy / counted_bins * 1e-9;
    std::vector<double> ring_median(ring_count, floor);
    for (int ring = 0; ring < ring_count; ++ring)
    {
        auto &values = ring_values[ring];
        if (values.empty())
            continue;
        auto middle = values.begin() + values.size() / 2;
        std::nth_element(values.begin(), middle, values.end());
        ring_median[ring] = std::max(static_cast<double>(*middle), floor);
    }

    auto wrap = [](int value, int size)
    {
        return ((value % size) + size) % size;
    };

    cv::Mat in_band(rows, cols, CV_8U, cv::Scalar(0));
    double band_energy = 0.0;
    int peak_count = 0;

    for (int y = 0; y < rows; ++y)
    {
        for (int x = 0; x < cols; ++x)
        {
            if (excluded.at<uint8_t>(y, x))
                continue;

            const float value = power.at<float>(y, x);
            if (value / ring_median[ring_index.at<int>(y, x)] <= settings_.peak_ratio)
                continue;

            // Must dominate all 8 neighbours, excluded ones included, so that the
            // first bin past the DC cutoff of a smoothly decaying spectrum is not a peak
            bool is_local_max = true;
            for (int dy = -1; dy <= 1 && is_local_max; ++dy)
            {
                for (int dx = -1; dx <= 1; ++dx)
                {
                    if (dx == 0 && dy == 0)
                        continue;
                    if (power.at<float>(wrap(y + dy, rows), wrap(x + dx, cols)) > value)
                    {
                        is_local_max = false;
                        break;
                    }
                }
            }
            if (!is_local_max)
                continue;

            ++peak_count;
            for (int dy = -settings_.peak_radius; dy <= settings_.peak_radius; ++dy)
            {
                for (int dx = -settings_.peak_radius; dx <= settings_.peak_radius; ++dx)
                {
                    const int by = wrap(y + dy, rows);
                    const int bx = wrap(x + dx, cols);
                    if (excluded.at<uint8_t>(by, bx) || in_band.at<uint8_t>(by, bx))
                        continue;
                    in_band.at<uint8_t>(by, bx) = 1;
                    band_energy += power.at<float>(by, bx);
                }
            }
        }
    }

    Logger::trace("Periodicity: " + std::to_string(peak_count) + " spectral peaks");
    return std::clamp(band_energy / total_energy, 0.0, 1.0);
}
