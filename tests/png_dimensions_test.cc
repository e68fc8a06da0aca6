#include "imagegeom/image_geometry.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace imagegeom {
namespace {

    static void append_u32be(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    }


    static void append_bytes(std::vector<std::byte>* out, std::string_view s)
    {
        for (char c : s) {
            out->push_back(std::byte { static_cast<uint8_t>(c) });
        }
    }


    static std::vector<std::byte> make_png(std::string_view first_chunk,
                                           uint32_t chunk_len, uint32_t width,
                                           uint32_t height)
    {
        std::vector<std::byte> png = {
            std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
            std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
            std::byte { 0x1A }, std::byte { 0x0A },
        };
        append_u32be(&png, chunk_len);
        append_bytes(&png, first_chunk);
        append_u32be(&png, width);
        append_u32be(&png, height);
        // bit depth, color type, compression, filter, interlace
        png.push_back(std::byte { 0x08 });
        png.push_back(std::byte { 0x02 });
        png.push_back(std::byte { 0x00 });
        png.push_back(std::byte { 0x00 });
        png.push_back(std::byte { 0x00 });
        append_u32be(&png, 0x878AC50FU);  // CRC (not verified)
        return png;
    }


    TEST(PngDimensions, ReadsIhdr)
    {
        const std::vector<std::byte> png = make_png("IHDR", 13, 150, 250);

        const DimensionsResult res = decode_png_dimensions(png);
        ASSERT_EQ(res.status, GeometryStatus::Ok);
        EXPECT_EQ(res.dimensions.width, 150U);
        EXPECT_EQ(res.dimensions.height, 250U);
        EXPECT_EQ(res.dimensions.format, ImageFormat::Png);
        EXPECT_EQ(res.source_id, fourcc('I', 'H', 'D', 'R'));
        EXPECT_EQ(res.source_offset, 8U);
    }


    TEST(PngDimensions, MinimalTwentyFourByteBuffer)
    {
        std::vector<std::byte> png = make_png("IHDR", 13, 0x7FFFFFFFU, 1);
        png.resize(24);

        const DimensionsResult res = decode_png_dimensions(png);
        ASSERT_EQ(res.status, GeometryStatus::Ok);
        EXPECT_EQ(res.dimensions.width, 0x7FFFFFFFU);
        EXPECT_EQ(res.dimensions.height, 1U);
    }


    TEST(PngDimensions, FirstChunkMustBeIhdr)
    {
        EXPECT_EQ(decode_png_dimensions(make_png("IDAT", 13, 150, 250)).status,
                  GeometryStatus::MalformedHeader);
        // Chunk types are case-sensitive.
        EXPECT_EQ(decode_png_dimensions(make_png("ihdr", 13, 150, 250)).status,
                  GeometryStatus::MalformedHeader);
    }


    TEST(PngDimensions, ShortIhdrLengthIsMalformed)
    {
        EXPECT_EQ(decode_png_dimensions(make_png("IHDR", 12, 150, 250)).status,
                  GeometryStatus::MalformedHeader);
        EXPECT_EQ(decode_png_dimensions(make_png("IHDR", 0, 150, 250)).status,
                  GeometryStatus::MalformedHeader);

        // Larger lengths are tolerated.
        EXPECT_EQ(decode_png_dimensions(make_png("IHDR", 14, 150, 250)).status,
                  GeometryStatus::Ok);
    }


    TEST(PngDimensions, ZeroDimensionIsMalformed)
    {
        EXPECT_EQ(decode_png_dimensions(make_png("IHDR", 13, 0, 250)).status,
                  GeometryStatus::MalformedHeader);
        EXPECT_EQ(decode_png_dimensions(make_png("IHDR", 13, 150, 0)).status,
                  GeometryStatus::MalformedHeader);
    }


    TEST(PngDimensions, TooShortToClassify)
    {
        std::vector<std::byte> png = make_png("IHDR", 13, 150, 250);
        png.resize(23);
        EXPECT_EQ(decode_png_dimensions(png).status,
                  GeometryStatus::UnsupportedFormat);
    }

}  // namespace
}  // namespace imagegeom
