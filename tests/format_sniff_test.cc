#include "imagegeom/image_geometry.h"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

namespace imagegeom {
namespace {

    static void append_bytes(std::vector<std::byte>* out, std::string_view s)
    {
        for (char c : s) {
            out->push_back(std::byte { static_cast<uint8_t>(c) });
        }
    }


    static void append_u32le(std::vector<std::byte>* out, uint32_t v)
    {
        out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
        out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
    }


    static std::vector<std::byte> png_prefix(size_t total_size)
    {
        std::vector<std::byte> out = {
            std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
            std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
            std::byte { 0x1A }, std::byte { 0x0A },
        };
        out.resize(total_size, std::byte { 0x00 });
        return out;
    }


    TEST(FormatSniff, RecognizesRiffWebp)
    {
        std::vector<std::byte> webp;
        append_bytes(&webp, "RIFF");
        append_u32le(&webp, 4);
        append_bytes(&webp, "WEBP");
        ASSERT_EQ(webp.size(), 12U);
        EXPECT_EQ(classify_image(webp), ImageFormat::Webp);
    }


    TEST(FormatSniff, RiffWithoutWebpFormIsUnknown)
    {
        std::vector<std::byte> wav;
        append_bytes(&wav, "RIFF");
        append_u32le(&wav, 4);
        append_bytes(&wav, "WAVE");
        EXPECT_EQ(classify_image(wav), ImageFormat::Unknown);
    }


    TEST(FormatSniff, ShortWebpHeaderIsUnknown)
    {
        std::vector<std::byte> webp;
        append_bytes(&webp, "RIFF");
        append_u32le(&webp, 4);
        append_bytes(&webp, "WEB");
        ASSERT_EQ(webp.size(), 11U);
        EXPECT_EQ(classify_image(webp), ImageFormat::Unknown);
    }


    TEST(FormatSniff, RecognizesJpegFromThreeBytes)
    {
        const std::array<std::byte, 3> jpeg = {
            std::byte { 0xFF },
            std::byte { 0xD8 },
            std::byte { 0xFF },
        };
        EXPECT_EQ(classify_image(jpeg), ImageFormat::Jpeg);

        const std::array<std::byte, 2> soi_only = {
            std::byte { 0xFF },
            std::byte { 0xD8 },
        };
        EXPECT_EQ(classify_image(soi_only), ImageFormat::Unknown);

        const std::array<std::byte, 3> no_marker = {
            std::byte { 0xFF },
            std::byte { 0xD8 },
            std::byte { 0x00 },
        };
        EXPECT_EQ(classify_image(no_marker), ImageFormat::Unknown);
    }


    TEST(FormatSniff, PngRequiresRoomForIhdr)
    {
        EXPECT_EQ(classify_image(png_prefix(24)), ImageFormat::Png);
        EXPECT_EQ(classify_image(png_prefix(23)), ImageFormat::Unknown);
        EXPECT_EQ(classify_image(png_prefix(8)), ImageFormat::Unknown);
    }


    TEST(FormatSniff, PngSignatureMustMatchExactly)
    {
        std::vector<std::byte> png = png_prefix(32);
        png[4]                     = std::byte { 0x0A };  // CR lost in transit
        EXPECT_EQ(classify_image(png), ImageFormat::Unknown);
    }


    TEST(FormatSniff, ArbitraryBytesAreUnknown)
    {
        const std::array<std::byte, 4> junk = {
            std::byte { 0x00 },
            std::byte { 0x01 },
            std::byte { 0x02 },
            std::byte { 0x03 },
        };
        EXPECT_EQ(classify_image(junk), ImageFormat::Unknown);
        EXPECT_EQ(classify_image({}), ImageFormat::Unknown);

        std::vector<std::byte> gif;
        append_bytes(&gif, "GIF89a");
        append_u32le(&gif, 0x00010001U);
        append_u32le(&gif, 0);
        EXPECT_EQ(classify_image(gif), ImageFormat::Unknown);
    }

}  // namespace
}  // namespace imagegeom
