#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>
#include <vector>
#include "StandardImageDecoder.hpp"
#include "TestSupport.hpp"

using namespace testing_support;

// ============================================================================
// JPEG
// ============================================================================

/** @brief A JPEG decodes to opaque RGBA with the encoded colour (within quantisation error) */
TEST(StandardImageDecoderTest, DecodesJpeg) {
    BitmapPtr bmp = StandardImageDecoder::decode_jpeg(encode_jpeg(8, 4));
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(bmp->width(), 8);
    EXPECT_EQ(bmp->height(), 4);
    EXPECT_EQ(bmp->format(), PixelFormat::Rgba8888);

    const uint8_t* px = bmp->row(2) + 3 * 4;
    EXPECT_LE(std::abs(px[0] - 200), 8);
    EXPECT_LE(std::abs(px[1] - 100), 8);
    EXPECT_LE(std::abs(px[2] - 50), 8);
    EXPECT_EQ(px[3], 255);
}

TEST(StandardImageDecoderTest, CorruptJpegThrows) {
    std::vector<uint8_t> data = encode_jpeg(8, 4);
    data.resize(20);
    EXPECT_THROW(StandardImageDecoder::decode_jpeg(data), std::runtime_error);
    EXPECT_THROW(StandardImageDecoder::decode_jpeg({ 1, 2, 3, 4, 5 }), std::runtime_error);
}

// ============================================================================
// PNG
// ============================================================================

TEST(StandardImageDecoderTest, DecodesRgbaPngExactly) {
    const std::vector<uint8_t> px = {
        255, 0, 0, 255,    0, 255, 0, 128,   0, 0, 255, 0,
        10, 20, 30, 40,    50, 60, 70, 80,   90, 100, 110, 120,
    };
    BitmapPtr bmp = StandardImageDecoder::decode_png(encode_png(3, 2, PNG_COLOR_TYPE_RGBA, px));
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(bmp->width(), 3);
    EXPECT_EQ(bmp->height(), 2);
    for (int y = 0; y < 2; ++y)
        for (int i = 0; i < 12; ++i)
            EXPECT_EQ(bmp->row(y)[i], px[static_cast<size_t>(y) * 12 + i]);
}

/** @brief Grayscale expands to RGB with an opaque filler */
TEST(StandardImageDecoderTest, DecodesGrayPng) {
    BitmapPtr bmp = StandardImageDecoder::decode_png(encode_png(2, 2, PNG_COLOR_TYPE_GRAY, { 0, 64, 128, 255 }));
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(bmp->format(), PixelFormat::Rgba8888);
    const uint8_t* p = bmp->row(1);
    EXPECT_EQ(p[0], 128);
    EXPECT_EQ(p[1], 128);
    EXPECT_EQ(p[2], 128);
    EXPECT_EQ(p[3], 255);
}

TEST(StandardImageDecoderTest, TruncatedPngThrows) {
    std::vector<uint8_t> data = encode_png(4, 4, PNG_COLOR_TYPE_GRAY, std::vector<uint8_t>(16, 9));
    ASSERT_GT(data.size(), 40u);
    data.resize(40);
    EXPECT_THROW(StandardImageDecoder::decode_png(data), std::runtime_error);
}

// ============================================================================
// SIGNATURE ROUTING
// ============================================================================

TEST(StandardImageDecoderTest, RoutesBySignature) {
    StandardImageDecoder decoder;
    BitmapPtr png = decoder.decode(MemoryImageFile("/img/a.jpg",
                                   encode_png(5, 3, PNG_COLOR_TYPE_GRAY, std::vector<uint8_t>(15, 1))));
    ASSERT_NE(png, nullptr);
    EXPECT_EQ(png->width(), 5);

    BitmapPtr jpg = decoder.decode(MemoryImageFile("/img/b.png", encode_jpeg(6, 2)));
    ASSERT_NE(jpg, nullptr);
    EXPECT_EQ(jpg->width(), 6);
}

TEST(StandardImageDecoderTest, UnknownSignatureThrows) {
    StandardImageDecoder decoder;
    EXPECT_THROW(decoder.decode(MemoryImageFile("/img/x.jpg", { 'h', 'e', 'l', 'l', 'o' })), std::runtime_error);
    EXPECT_THROW(decoder.decode(MemoryImageFile("/img/empty.jpg")), std::runtime_error);
}
