#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

// Hand-built EXIF carriers for reader and loader tests
namespace exif_fixtures
{
    struct AsciiTag
    {
        uint16_t tag;
        std::string value;
    };

    inline void put16(std::vector<uint8_t> &out, size_t offset, uint16_t value, bool little_endian)
    {
        out[offset] = little_endian ? value & 0xFF : value >> 8;
        out[offset + 1] = little_endian ? value >> 8 : value & 0xFF;
    }

    inline void put32(std::vector<uint8_t> &out, size_t offset, uint32_t value, bool little_endian)
    {
        for (int i = 0; i < 4; ++i)
        {
            const int shift = little_endian ? 8 * i : 8 * (3 - i);
            out[offset + i] = static_cast<uint8_t>((value >> shift) & 0xFF);
        }
    }

    // TIFF stream with a single IFD holding ASCII entries
    inline std::vector<uint8_t> buildTiff(const std::vector<AsciiTag> &tags, bool little_endian = true)
    {
        const size_t ifd_size = 2 + tags.size() * 12 + 4;
        std::vector<uint8_t> out(8 + ifd_size, 0);
        out[0] = out[1] = little_endian ? 'I' : 'M';
        put16(out, 2, 42, little_endian);
        put32(out, 4, 8, little_endian);
        put16(out, 8, static_cast<uint16_t>(tags.size()), little_endian);

        for (size_t i = 0; i < tags.size(); ++i)
        {
            const size_t entry = 10 + i * 12;
            const std::string &value = tags[i].value;
            const uint32_t count = static_cast<uint32_t>(value.size() + 1);

            put16(out, entry, tags[i].tag, little_endian);
            put16(out, entry + 2, 2, little_endian);
            put32(out, entry + 4, count, little_endian);
            if (count <= 4)
            {
                std::copy(value.begin(), value.end(), out.begin() + entry + 8);
            }
            else
            {
                put32(out, entry + 8, static_cast<uint32_t>(out.size()), little_endian);
                out.insert(out.end(), value.begin(), value.end());
                out.push_back(0);
            }
        }
        return out;
    }

    inline std::vector<uint8_t> wrapInJpeg(const std::vector<uint8_t> &tiff)
    {
        std::vector<uint8_t> out = {0xFF, 0xD8};
        // An APP0 segment ahead of the EXIF one
        const std::vector<uint8_t> app0 = {0xFF, 0xE0, 0x00, 0x07, 'J', 'F', 'I', 'F', 0x00};
        out.insert(out.end(), app0.begin(), app0.end());

        const size_t length = 2 + 6 + tiff.size();
        out.push_back(0xFF);
        out.push_back(0xE1);
        out.push_back(static_cast<uint8_t>(length >> 8));
        out.push_back(static_cast<uint8_t>(length & 0xFF));
        const char exif[] = {'E', 'x', 'i', 'f', 0, 0};
        out.insert(out.end(), exif, exif + 6);
        out.insert(out.end(), tiff.begin(), tiff.end());
        out.push_back(0xFF);
        out.push_back(0xD9);
        return out;
    }

    inline std::vector<uint8_t> wrapInPng(const std::vector<uint8_t> &tiff)
    {
        std::vector<uint8_t> out = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
        auto chunk = [&out](const char *type, const std::vector<uint8_t> &data)
        {
            const uint32_t length = static_cast<uint32_t>(data.size());
            for (int shift = 24; shift >= 0; shift -= 8)
                out.push_back(static_cast<uint8_t>((length >> shift) & 0xFF));
            out.insert(out.end(), type, type + 4);
            out.insert(out.end(), data.begin(), data.end());
            out.insert(out.end(), 4, 0); // CRC is not checked
        };
        chunk("IHDR", std::vector<uint8_t>(13, 0));
        chunk("eXIf", tiff);
        chunk("IEND", {});
        return out;
    }

    // Insert an APP1 EXIF segment right after the SOI marker of a complete JPEG
    inline std::vector<uint8_t> insertExifIntoJpeg(const std::vector<uint8_t> &jpeg, const std::vector<uint8_t> &tiff)
    {
        std::vector<uint8_t> segment = wrapInJpeg(tiff);
        // Keep only the APP1 segment: drop SOI, the APP0 segment (9 bytes) and EOI
        std::vector<uint8_t> app1(segment.begin() + 2 + 9, segment.end() - 2);

        std::vector<uint8_t> out(jpeg.begin(), jpeg.begin() + 2);
        out.insert(out.end(), app1.begin(), app1.end());
        out.insert(out.end(), jpeg.begin() + 2, jpeg.end());
        return out;
    }
}
