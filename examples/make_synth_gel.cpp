#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Synthetic test images for bioproof:
//   make_synth_gel <out.png> [--seed N] [--width W] [--height H] [--lanes L] [--stamp stamp.png]
// Writes a gel electrophoresis-like image. With --stamp, also writes the
// 48x48 "DG" watermark stamp and a stamped copy of the gel (<out>_stamped.png).

static cv::Mat synthGel(int width, int height, int lanes, unsigned seed)
{
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> band_count(2, 5);
    std::uniform_int_distribution<int> band_y(40, height - 40);
    std::uniform_int_distribution<int> band_thickness(4, 10);
    std::uniform_real_distribution<float> band_value(0.5f, 0.9f);

    cv::Mat img(height, width, CV_32FC1, cv::Scalar(0.1));
    const int lane_width = width / (lanes + 2);
    const int x0 = lane_width / 2;

    for (int i = 0; i < lanes; ++i)
    {
        const int cx = x0 + i * lane_width;
        std::vector<int> ys(band_count(rng));
        for (auto &y : ys)
            y = band_y(rng);
        std::sort(ys.begin(), ys.end());

        for (int y : ys)
        {
            const int thickness = band_thickness(rng);
            cv::rectangle(img, cv::Point(cx - 20, y - thickness / 2), cv::Point(cx + 20, y + thickness / 2),
                          cv::Scalar(band_value(rng)), cv::FILLED);
        }
    }

    cv::GaussianBlur(img, img, cv::Size(7, 7), 0);
    cv::Mat noise(img.size(), CV_32FC1);
    cv::theRNG().state = seed;
    cv::randn(noise, 0.0, 0.03);
    img += noise;

    cv::Mat gel;
    img.convertTo(gel, CV_8UC1, 255.0); // Saturating cast clips to [0, 255]
    return gel;
}

static cv::Mat digitalStamp()
{
    cv::Mat stamp(48, 48, CV_8UC1, cv::Scalar(0));
    cv::putText(stamp, "DG", cv::Point(4, 34), cv::FONT_HERSHEY_SIMPLEX, 0.9, cv::Scalar(255), 2, cv::LINE_AA);
    return stamp;
}

int main(int argc, char **argv)
{
    if (argc < 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")
    {
        std::cerr << "Usage: make_synth_gel <out.png> [--seed N] [--width W] [--height H] [--lanes L] [--stamp stamp.png]" << std::endl;
        return 2;
    }

    std::string output = argv[1];
    std::string stamp_path;
    int width = 800;
    int height = 400;
    int lanes = 8;
    unsigned seed = 3;

    try
    {
        for (int i = 2; i < argc; i++)
        {
            std::string arg = argv[i];
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                return 2;
            }
            std::string value = argv[++i];
            if (arg == "--seed")
                seed = static_cast<unsigned>(std::stoul(value));
            else if (arg == "--width")
                width = std::stoi(value);
            else if (arg == "--height")
                height = std::stoi(value);
            else if (arg == "--lanes")
                lanes = std::stoi(value);
            else if (arg == "--stamp")
                stamp_path = value;
            else
            {
                std::cerr << "Unknown option " << arg << std::endl;
                return 2;
            }
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return 2;
    }

    if (width < 128 || height < 128 || lanes < 1 || width / (lanes + 2) < 48)
    {
        std::cerr << "Image too small for the requested lane count" << std::endl;
        return 2;
    }

    try
    {
        const auto parent = std::filesystem::path(output).parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent);

        cv::Mat gel = synthGel(width, height, lanes, seed);
        if (!cv::imwrite(output, gel))
        {
            std::cerr << "imwrite failed: " << output << std::endl;
            return 1;
        }
        std::cout << "Created " << output << std::endl;

        if (!stamp_path.empty())
        {
            cv::Mat stamp = digitalStamp();
            if (!cv::imwrite(stamp_path, stamp))
            {
                std::cerr << "imwrite failed: " << stamp_path << std::endl;
                return 1;
            }
            std::cout << "Created " << stamp_path << std::endl;

            // Stamp in the top-right corner, inside the 96x96 search window
            stamp.copyTo(gel(cv::Rect(gel.cols - 48 - 8, 8, 48, 48)));
            const std::filesystem::path out_path(output);
            const std::string stamped = (out_path.parent_path() / (out_path.stem().string() + "_stamped" +
                                                                   out_path.extension().string()))
                                            .string();
            if (!cv::imwrite(stamped, gel))
            {
                std::cerr << "imwrite failed: " << stamped << std::endl;
                return 1;
            }
            std::cout << "Created " << stamped << std::endl;
        }
    }
    catch (const cv::Exception &e)
    {
        std::cerr << "OpenCV error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        std::cerr << "Filesystem error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
