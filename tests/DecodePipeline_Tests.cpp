#include <gtest/gtest.h>
#include <string>
#include "DecodePipeline.hpp"
#include "TestSupport.hpp"

using namespace testing_support;

namespace {

struct PipelineRig {
    FakeDecoder decoder;
    NoopFormatDecoder none;
    FakeMetadata metadata;
    DecodePipeline pipeline{ decoder, none, metadata, DecodePipeline::default_alternate_extensions() };
};

// Pixel (x, y) of a FakeDecoder bitmap carries its source coordinates in bytes 0 and 1.
std::pair<int, int> origin_of(const Bitmap& bmp, int x, int y) {
    const uint8_t* px = bmp.row(y) + static_cast<size_t>(x) * bytes_per_pixel(bmp.format());
    return { px[0], px[1] };
}

} // namespace

// ============================================================================
// ORIENTATION
// ============================================================================

/** @brief Orientation 6 turns a 100x200 decode into 200x100 */
TEST(DecodePipelineTest, Orientation6SwapsDimensions) {
    PipelineRig rig;
    rig.decoder.set("/img/p.jpg", 100, 200);
    rig.metadata.set_orientation("/img/p.jpg", 6);

    BitmapPtr bmp = rig.pipeline.decode(MemoryImageFile("/img/p.jpg"));
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(bmp->width(), 200);
    EXPECT_EQ(bmp->height(), 100);
}

TEST(DecodePipelineTest, Orientation1Unchanged) {
    PipelineRig rig;
    rig.decoder.set("/img/p.jpg", 100, 200);

    BitmapPtr bmp = rig.pipeline.decode(MemoryImageFile("/img/p.jpg"));
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(bmp->width(), 100);
    EXPECT_EQ(bmp->height(), 200);
    EXPECT_EQ(origin_of(*bmp, 3, 5), std::make_pair(3, 5));
}

/** @brief 90 degrees clockwise: the top-left source pixel ends up top-right */
TEST(DecodePipelineTest, Orientation6PixelMapping) {
    PipelineRig rig;
    rig.decoder.set("/img/r.jpg", 3, 2);
    rig.metadata.set_orientation("/img/r.jpg", 6);

    BitmapPtr bmp = rig.pipeline.decode(MemoryImageFile("/img/r.jpg"));
    ASSERT_NE(bmp, nullptr);
    ASSERT_EQ(bmp->width(), 2);
    ASSERT_EQ(bmp->height(), 3);
    EXPECT_EQ(origin_of(*bmp, 1, 0), std::make_pair(0, 0));
    EXPECT_EQ(origin_of(*bmp, 0, 0), std::make_pair(0, 1));
    EXPECT_EQ(origin_of(*bmp, 0, 2), std::make_pair(2, 1));
}

TEST(DecodePipelineTest, Orientation3PixelMapping) {
    PipelineRig rig;
    rig.decoder.set("/img/r.jpg", 2, 2);
    rig.metadata.set_orientation("/img/r.jpg", 3);

    BitmapPtr bmp = rig.pipeline.decode(MemoryImageFile("/img/r.jpg"));
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(origin_of(*bmp, 0, 0), std::make_pair(1, 1));
    EXPECT_EQ(origin_of(*bmp, 1, 0), std::make_pair(0, 1));
    EXPECT_EQ(origin_of(*bmp, 1, 1), std::make_pair(0, 0));
}

/** @brief 270 degrees clockwise: the top-left source pixel ends up bottom-left */
TEST(DecodePipelineTest, Orientation8PixelMapping) {
    PipelineRig rig;
    rig.decoder.set("/img/r.jpg", 3, 2);
    rig.metadata.set_orientation("/img/r.jpg", 8);

    BitmapPtr bmp = rig.pipeline.decode(MemoryImageFile("/img/r.jpg"));
    ASSERT_NE(bmp, nullptr);
    ASSERT_EQ(bmp->width(), 2);
    ASSERT_EQ(bmp->height(), 3);
    EXPECT_EQ(origin_of(*bmp, 0, 2), std::make_pair(0, 0));
    EXPECT_EQ(origin_of(*bmp, 1, 0), std::make_pair(2, 1));
}

/** @brief Mirroring orientations apply their rotation only */
TEST(DecodePipelineTest, MirrorOrientationsRotateOnly) {
    PipelineRig rig;
    rig.decoder.set("/img/m2.jpg", 4, 2);
    rig.decoder.set("/img/m5.jpg", 4, 2);
    rig.metadata.set_orientation("/img/m2.jpg", 2);
    rig.metadata.set_orientation("/img/m5.jpg", 5);

    BitmapPtr m2 = rig.pipeline.decode(MemoryImageFile("/img/m2.jpg"));
    ASSERT_NE(m2, nullptr);
    EXPECT_EQ(m2->width(), 4);
    EXPECT_EQ(origin_of(*m2, 0, 0), std::make_pair(0, 0));

    BitmapPtr m5 = rig.pipeline.decode(MemoryImageFile("/img/m5.jpg"));
    ASSERT_NE(m5, nullptr);
    EXPECT_EQ(m5->width(), 2);
    EXPECT_EQ(m5->height(), 4);
}

TEST(DecodePipelineTest, MetadataFailureMeansNoRotation) {
    PipelineRig rig;
    rig.decoder.set("/img/p.jpg", 100, 200);
    rig.metadata.set_orientation("/img/p.jpg", 6);
    rig.metadata.set_throw(true);

    BitmapPtr bmp = rig.pipeline.decode(MemoryImageFile("/img/p.jpg"));
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(bmp->width(), 100);
    EXPECT_EQ(bmp->height(), 200);
}

/** @brief After rotation only the rotated buffer survives */
TEST(DecodePipelineTest, PreRotationBufferReleased) {
    PipelineRig rig;
    rig.decoder.set("/img/p.jpg", 8, 4);
    rig.metadata.set_orientation("/img/p.jpg", 6);

    BitmapPtr bmp = rig.pipeline.decode(MemoryImageFile("/img/p.jpg"));
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(rig.decoder.released(), 1);
}

// ============================================================================
// FAILURES
// ============================================================================

TEST(DecodePipelineTest, ZeroSizeIsFailure) {
    PipelineRig rig;
    rig.decoder.set("/img/empty.jpg", 0, 0);
    EXPECT_EQ(rig.pipeline.decode(MemoryImageFile("/img/empty.jpg")), nullptr);
}

TEST(DecodePipelineTest, DecoderExceptionIsFailure) {
    PipelineRig rig;
    rig.decoder.set("/img/bad.jpg", 10, 10, 0, true);
    BitmapPtr bmp;
    EXPECT_NO_THROW(bmp = rig.pipeline.decode(MemoryImageFile("/img/bad.jpg")));
    EXPECT_EQ(bmp, nullptr);
}

/** @brief Alternate formats without an installed decoder fail without touching the standard decoder */
TEST(DecodePipelineTest, UnsupportedAlternateFormat) {
    PipelineRig rig;
    EXPECT_TRUE(rig.pipeline.is_alternate_format("/img/shot.HEIC"));
    EXPECT_FALSE(rig.pipeline.is_alternate_format("/img/shot.jpg"));

    EXPECT_EQ(rig.pipeline.decode(MemoryImageFile("/img/shot.HEIC")), nullptr);
    EXPECT_EQ(rig.decoder.total_decodes(), 0);
    EXPECT_EQ(rig.pipeline.decode_thumbnail(MemoryImageFile("/img/shot.heic")), nullptr);
}

TEST(DecodePipelineTest, SupportedAlternateFormatUsesPlugin) {
    FakeDecoder standard;
    FakeFormatDecoder heif(64, 48);
    FakeMetadata metadata;
    DecodePipeline pipeline(standard, heif, metadata, { "heic", ".AVIF" });

    BitmapPtr bmp = pipeline.decode(MemoryImageFile("/img/shot.heic"));
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(bmp->width(), 64);
    EXPECT_EQ(heif.decodes.load(), 1);
    EXPECT_EQ(standard.total_decodes(), 0);
    EXPECT_TRUE(pipeline.is_alternate_format("/img/x.avif"));
    EXPECT_FALSE(pipeline.is_alternate_format("/img/x.heif"));
}

/** @brief Thumbnails default to a 120 pixel edge */
TEST(DecodePipelineTest, ThumbnailThroughPlugin) {
    FakeDecoder standard;
    FakeFormatDecoder heif(64, 48);
    FakeMetadata metadata;
    DecodePipeline pipeline(standard, heif, metadata, DecodePipeline::default_alternate_extensions());

    BitmapPtr thumb = pipeline.decode_thumbnail(MemoryImageFile("/img/shot.heic"));
    ASSERT_NE(thumb, nullptr);
    EXPECT_EQ(heif.last_max_size, kDefaultThumbnailSize);
    EXPECT_EQ(thumb->width(), 120);

    pipeline.decode_thumbnail(MemoryImageFile("/img/shot.heic"), 256);
    EXPECT_EQ(heif.last_max_size, 256);
    EXPECT_EQ(pipeline.decode_thumbnail(MemoryImageFile("/img/plain.jpg")), nullptr);
}

// ============================================================================
// ALPHA STRIPPING
// ============================================================================

TEST(DecodePipelineTest, StripAlphaProducesThreeByteBitmaps) {
    PipelineRig rig;
    rig.decoder.set("/img/p.jpg", 6, 5);
    rig.pipeline.set_strip_alpha(true);

    BitmapPtr bmp = rig.pipeline.decode(MemoryImageFile("/img/p.jpg"));
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(bmp->format(), PixelFormat::Rgb888);
    EXPECT_EQ(bmp->byte_size(), 6u * 5u * 3u);
    EXPECT_EQ(origin_of(*bmp, 4, 3), std::make_pair(4, 3));
}

TEST(DecodePipelineTest, StripAlphaKeepsBgrOrder) {
    PipelineRig rig;
    rig.decoder.set("/img/b.jpg", 3, 3, 0, false, PixelFormat::Bgra8888);
    rig.pipeline.set_strip_alpha(true);

    BitmapPtr bmp = rig.pipeline.decode(MemoryImageFile("/img/b.jpg"));
    ASSERT_NE(bmp, nullptr);
    EXPECT_EQ(bmp->format(), PixelFormat::Bgr888);
}
