#include "core/image_loader.hpp"
#include "core/exif_reader.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <libraw/libraw.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <ctime>
#include <stdexcept>

namespace
{
    const char *const kCannotReadImage = "cannot read image";

    // Owns a LibRaw processor and the developed image it hands out
    class LibRawRAII
    {
    public:
        LibRawRAII() : raw_(new LibRaw()), img_(nullptr) {}
        ~LibRawRAII() { cleanup(); }

        LibRawRAII(const LibRawRAII &) = delete;
        LibRawRAII &operator=(const LibRawRAII &) = delete;

        void cleanup()
        {
            if (img_)
            {
                LibRaw::dcraw_clear_mem(img_);
                img_ = nullptr;
            }
            if (raw_)
            {
                raw_->recycle();
                delete raw_;
                raw_ = nullptr;
            }
        }

        LibRaw *getRaw() { return raw_; }
        libraw_processed_image_t *getImg() { return img_; }
        void setImg(libraw_processed_image_t *i) { img_ = i; }

    private:
        LibRaw *raw_;
        libraw_processed_image_t *img_;
    };

    std::string trimmed(const char *value)
    {
        std::string text(value ? value : "");
        while (!text.empty() && text.back() == ' ')
            text.pop_back();
        return text;
    }

    std::string formatTimestamp(std::time_t timestamp)
    {
        std::tm tm{};
        gmtime_r(&timestamp, &tm);
        char buffer[32];
        if (std::strftime(buffer, sizeof(buffer), "%Y:%m:%d %H:%M:%S", &tm) == 0)
            return "";
        return buffer;
    }
}

ImageLoader::ImageLoader(size_t header_scan_bytes)
    : header_scan_bytes_(header_scan_bytes)
{
}

const std::vector<std::string> &ImageLoader::supportedExtensions()
{
    static const std::vector<std::string> extensions = {
        "tif", "tiff", "png", "jpg", "jpeg",
        "dng", "nef", "cr2", "arw", "orf", "pef", "rw2", "raf", "srw"};
    return extensions;
}

bool ImageLoader::isCameraRawFormat(const std::string &format)
{
    static const std::vector<std::string> raw_formats = {"dng", "nef", "cr2", "arw", "orf", "pef", "rw2", "raf", "srw"};
    return std::find(raw_formats.begin(), raw_formats.end(), format) != raw_formats.end();
}

LoadResult ImageLoader::load(const std::string &file_path) const
{
    std::vector<uint8_t> bytes;
    try
    {
        bytes = FileUtils::readFileBytes(file_path);
    }
    catch (const std::exception &e)
    {
        Logger::warn(std::string("Failed to read ") + file_path + ": " + e.what());
        return LoadResult(false, kCannotReadImage);
    }

    LoadResult result = decode(bytes, FileUtils::getFileExtension(file_path));
    if (!result.success)
    {
        Logger::warn("Failed to decode " + file_path + ": " + result.error_message);
    }
    return result;
}

LoadResult ImageLoader::decode(const std::vector<uint8_t> &bytes, const std::string &format) const
{
    if (bytes.empty())
    {
        return LoadResult(false, kCannotReadImage);
    }

    CaptureMetadata metadata;
    cv::Mat gray;

    if (isCameraRawFormat(format))
    {
        std::string error;
        if (!decodeCameraRaw(bytes, gray, metadata, error))
        {
            Logger::debug("LibRaw could not develop " + format + " data: " + error);
            return LoadResult(false, kCannotReadImage);
        }
    }
    else
    {
        gray = decodeWithOpenCV(bytes);
        if (gray.empty())
        {
            return LoadResult(false, kCannotReadImage);
        }
        metadata = ExifReader::readTags(bytes);
        metadata.is_raw_format = ExifReader::isTiffHeader(bytes.data(), bytes.size());
    }

    LoadResult result(true);
    try
    {
        result.input.image = ImageBuffer(gray);
    }
    catch (const std::invalid_argument &e)
    {
        Logger::debug(std::string("Unsupported pixel layout: ") + e.what());
        return LoadResult(false, kCannotReadImage);
    }

    result.input.metadata = metadata;
    result.input.format = format;
    result.input.header_bytes.assign(bytes.begin(), bytes.begin() + std::min(bytes.size(), header_scan_bytes_));

    Logger::debug("Decoded " + format + " image " + std::to_string(gray.cols) + "x" + std::to_string(gray.rows) +
                  ", " + metadata.toString());
    return result;
}

cv::Mat ImageLoader::decodeWithOpenCV(const std::vector<uint8_t> &bytes)
{
    try
    {
        return cv::imdecode(bytes, cv::IMREAD_GRAYSCALE | cv::IMREAD_ANYDEPTH);
    }
    catch (const cv::Exception &e)
    {
        Logger::debug(std::string("OpenCV decode error: ") + e.what());
        return cv::Mat();
    }
}

bool ImageLoader::decodeCameraRaw(const std::vector<uint8_t> &bytes, cv::Mat &gray, CaptureMetadata &metadata,
                                  std::string &error)
{
    LibRawRAII raii;
    LibRaw *raw = raii.getRaw();

    raw->imgdata.params.use_camera_wb = 1;
    raw->imgdata.params.use_auto_wb = 0;
    raw->imgdata.params.no_auto_bright = 1;
    raw->imgdata.params.output_bps = 16;
    raw->imgdata.params.output_color = 1; // sRGB
    raw->imgdata.params.half_size = 1;    // Detectors work on a downscaled grid anyway

    int rc = raw->open_buffer(const_cast<uint8_t *>(bytes.data()), bytes.size());
    if (rc != LIBRAW_SUCCESS)
    {
        error = std::string("open_buffer: ") + libraw_strerror(rc);
        return false;
    }

    rc = raw->unpack();
    if (rc != LIBRAW_SUCCESS)
    {
        error = std::string("unpack: ") + libraw_strerror(rc);
        return false;
    }

    rc = raw->dcraw_process();
    if (rc != LIBRAW_SUCCESS)
    {
        error = std::string("dcraw_process: ") + libraw_strerror(rc);
        return false;
    }

    raii.setImg(raw->dcraw_make_mem_image(&rc));
    libraw_processed_image_t *img = raii.getImg();
    if (!img || rc != LIBRAW_SUCCESS)
    {
        error = std::string("dcraw_make_mem_image: ") + libraw_strerror(rc);
        return false;
    }

    if (img->type != LIBRAW_IMAGE_BITMAP || img->bits != 16 || (img->colors != 3 && img->colors != 1))
    {
        error = "unsupported image buffer (type=" + std::to_string(img->type) + ", colors=" +
                std::to_string(img->colors) + ", bits=" + std::to_string(img->bits) + ")";
        return false;
    }

    try
    {
        if (img->colors == 3)
        {
            cv::Mat rgb(img->height, img->width, CV_16UC3, img->data);
            cv::cvtColor(rgb, gray, cv::COLOR_RGB2GRAY);
        }
        else
        {
            gray = cv::Mat(img->height, img->width, CV_16UC1, img->data).clone();
        }
    }
    catch (const cv::Exception &e)
    {
        error = std::string("color conversion: ") + e.what();
        return false;
    }

    const std::string make = trimmed(raw->imgdata.idata.make);
    const std::string model = trimmed(raw->imgdata.idata.model);
    if (!make.empty())
        metadata.setTag(CaptureTag::MAKE, make);
    if (!model.empty())
        metadata.setTag(CaptureTag::MODEL, model);
    if (raw->imgdata.other.timestamp > 0)
    {
        const std::string datetime = formatTimestamp(raw->imgdata.other.timestamp);
        if (!datetime.empty())
            metadata.setTag(CaptureTag::DATETIME, datetime);
    }
    metadata.is_raw_format = true;
    return true;
}

std::optional<ImageBuffer> ImageLoader::loadStamp(const std::string &path)
{
    if (path.empty())
    {
        return std::nullopt;
    }

    try
    {
        cv::Mat stamp = cv::imread(path, cv::IMREAD_GRAYSCALE | cv::IMREAD_ANYDEPTH);
        if (stamp.empty())
        {
            Logger::warn("Watermark stamp not found or unreadable: " + path + " (visible stamp check disabled)");
            return std::nullopt;
        }
        Logger::info("Loaded watermark stamp " + path);
        return ImageBuffer(stamp);
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("Failed to load watermark stamp " + path + ": " + e.what());
        return std::nullopt;
    }
    catch (const std::invalid_argument &e)
    {
        Logger::warn("Unsupported watermark stamp " + path + ": " + e.what());
        return std::nullopt;
    }
}
