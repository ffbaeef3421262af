#include "core/exif_reader.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cstring>

namespace
{
    constexpr uint16_t kTiffTypeAscii = 2;
    constexpr size_t kIfdEntrySize = 12;
    constexpr uint16_t kMaxIfdEntries = 1024;

    class TiffView
    {
    public:
        TiffView(const uint8_t *data, size_t size)
            : data_(data), size_(size), little_endian_(size >= 2 && data[0] == 'I') {}

        bool has(size_t offset, size_t length) const
        {
            return offset <= size_ && length <= size_ - offset;
        }

        uint16_t u16(size_t offset) const
        {
            if (little_endian_)
                return static_cast<uint16_t>(data_[offset] | (data_[offset + 1] << 8));
            return static_cast<uint16_t>((data_[offset] << 8) | data_[offset + 1]);
        }

        uint32_t u32(size_t offset) const
        {
            if (little_endian_)
                return static_cast<uint32_t>(data_[offset]) | (static_cast<uint32_t>(data_[offset + 1]) << 8) |
                       (static_cast<uint32_t>(data_[offset + 2]) << 16) | (static_cast<uint32_t>(data_[offset + 3]) << 24);
            return (static_cast<uint32_t>(data_[offset]) << 24) | (static_cast<uint32_t>(data_[offset + 1]) << 16) |
                   (static_cast<uint32_t>(data_[offset + 2]) << 8) | static_cast<uint32_t>(data_[offset + 3]);
        }

        const uint8_t *at(size_t offset) const { return data_ + offset; }

    private:
        const uint8_t *data_;
        size_t size_;
        bool little_endian_;
    };

    uint32_t readBigEndian32(const std::vector<uint8_t> &bytes, size_t offset)
    {
        return (static_cast<uint32_t>(bytes[offset]) << 24) | (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
               (static_cast<uint32_t>(bytes[offset + 2]) << 8) | static_cast<uint32_t>(bytes[offset + 3]);
    }

    // ASCII values are NUL terminated and often padded with spaces
    std::string trimAscii(const uint8_t *data, size_t length)
    {
        std::string value(reinterpret_cast<const char *>(data), length);
        const size_t nul = value.find('\0');
        if (nul != std::string::npos)
            value.resize(nul);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\n' || value.back() == '\r'))
            value.pop_back();
        return value;
    }
}

CaptureMetadata ExifReader::readTags(const std::vector<uint8_t> &bytes)
{
    auto stream = findTiffStream(bytes);
    if (!stream)
    {
        Logger::trace("EXIF: no TIFF stream found");
        return CaptureMetadata();
    }
    return parseTiff(bytes.data() + stream->first, stream->second);
}

std::optional<std::pair<size_t, size_t>> ExifReader::findTiffStream(const std::vector<uint8_t> &bytes)
{
    if (isTiffHeader(bytes.data(), bytes.size()))
        return std::make_pair(size_t(0), bytes.size());
    if (bytes.size() >= 2 && bytes[0] == 0xFF && bytes[1] == 0xD8)
        return findJpegExif(bytes);
    if (bytes.size() >= 8 && bytes[0] == 0x89 && bytes[1] == 'P' && bytes[2] == 'N' && bytes[3] == 'G')
        return findPngExif(bytes);
    return std::nullopt;
}

bool ExifReader::isTiffHeader(const uint8_t *data, size_t size)
{
    if (size < 8)
        return false;
    return (data[0] == 'I' && data[1] == 'I' && data[2] == 0x2A && data[3] == 0x00) ||
           (data[0] == 'M' && data[1] == 'M' && data[2] == 0x00 && data[3] == 0x2A);
}

std::optional<std::pair<size_t, size_t>> ExifReader::findJpegExif(const std::vector<uint8_t> &bytes)
{
    static const uint8_t kExifHeader[] = {'E', 'x', 'i', 'f', 0x00, 0x00};

    size_t offset = 2;
    while (offset + 4 <= bytes.size())
    {
        if (bytes[offset] != 0xFF)
            return std::nullopt;

        const uint8_t marker = bytes[offset + 1];
        if (marker == 0xFF)
        {
            // Fill byte
            ++offset;
            continue;
        }
        // Start of scan or end of image: no metadata follows
        if (marker == 0xDA || marker == 0xD9)
            return std::nullopt;

        const size_t length = (static_cast<size_t>(bytes[offset + 2]) << 8) | bytes[offset + 3];
        if (length < 2 || offset + 2 + length > bytes.size())
            return std::nullopt;

        const size_t payload = offset + 4;
        const size_t payload_length = length - 2;
        if (marker == 0xE1 && payload_length > sizeof(kExifHeader) &&
            std::memcmp(&bytes[payload], kExifHeader, sizeof(kExifHeader)) == 0)
        {
            return std::make_pair(payload + sizeof(kExifHeader), payload_length - sizeof(kExifHeader));
        }

        offset += 2 + length;
    }
    return std::nullopt;
}

std::optional<std::pair<size_t, size_t>> ExifReader::findPngExif(const std::vector<uint8_t> &bytes)
{
    size_t offset = 8;
    while (offset + 12 <= bytes.size())
    {
        const size_t length = readBigEndian32(bytes, offset);
        const size_t data = offset + 8;
        if (length > bytes.size() - data)
            return std::nullopt;

        if (std::memcmp(&bytes[offset + 4], "eXIf", 4) == 0)
            return std::make_pair(data, length);
        if (std::memcmp(&bytes[offset + 4], "IDAT", 4) == 0 || std::memcmp(&bytes[offset + 4], "IEND", 4) == 0)
            return std::nullopt;

        offset = data + length + 4; // Skip data and CRC
    }
    return std::nullopt;
}

CaptureMetadata ExifReader::parseTiff(const uint8_t *data, size_t size)
{
    CaptureMetadata metadata;
    if (!isTiffHeader(data, size))
        return metadata;

    TiffView tiff(data, size);
    const size_t ifd = tiff.u32(4);
    if (!tiff.has(ifd, 2))
        return metadata;

    const uint16_t entries = std::min(tiff.u16(ifd), kMaxIfdEntries);
    for (uint16_t i = 0; i < entries; ++i)
    {
        const size_t entry = ifd + 2 + i * kIfdEntrySize;
        if (!tiff.has(entry, kIfdEntrySize))
            break;

        const uint16_t tag = tiff.u16(entry);
        if (tag != static_cast<uint16_t>(CaptureTag::MAKE) && tag != static_cast<uint16_t>(CaptureTag::MODEL) &&
            tag != static_cast<uint16_t>(CaptureTag::DATETIME))
            continue;
        if (tiff.u16(entry + 2) != kTiffTypeAscii)
            continue;

        const size_t count = tiff.u32(entry + 4);
        // Values of up to 4 bytes are stored inline
        const size_t value_offset = count <= 4 ? entry + 8 : tiff.u32(entry + 8);
        if (count == 0 || !tiff.has(value_offset, count))
            continue;

        metadata.setTag(static_cast<CaptureTag>(tag), trimAscii(tiff.at(value_offset), count));
    }

    Logger::trace("EXIF: " + metadata.toString());
    return metadata;
}
