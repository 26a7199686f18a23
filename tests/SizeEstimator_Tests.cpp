#include <gtest/gtest.h>
#include "CacheStore.hpp"
#include "DecodePipeline.hpp"
#include "Dispatcher.hpp"
#include "SizeEstimator.hpp"
#include "TestSupport.hpp"

using namespace testing_support;

namespace {

struct EstimatorRig {
    FakeDecoder decoder;
    NoopFormatDecoder alternate;
    FakeMetadata metadata;
    DecodePipeline pipeline{ decoder, alternate, metadata, DecodePipeline::default_alternate_extensions() };
    ManualDispatcher ui;
    CacheStore store{ ui };
    SizeEstimator estimator{ metadata, store, pipeline };
};

} // namespace

// ============================================================================
// ESTIMATE SOURCES
// ============================================================================

/** @brief Metadata dimensions win; 4 bytes per pixel, 3 with alpha stripping */
TEST(SizeEstimatorTest, UsesMetadataDimensions) {
    EstimatorRig rig;
    rig.metadata.set_dimensions("/img/a.jpg", 30, 20);
    MemoryImageFile file("/img/a.jpg");

    EXPECT_EQ(rig.estimator.estimate(file), 30u * 20u * 4u);
    rig.pipeline.set_strip_alpha(true);
    EXPECT_EQ(rig.estimator.estimate(file), 30u * 20u * 3u);
}

/** @brief Without dimensions the mean cached entry size is used */
TEST(SizeEstimatorTest, FallsBackToCacheAverage) {
    EstimatorRig rig;
    rig.store.insert("/x.jpg", std::make_shared<Bitmap>(10, 10, PixelFormat::Rgba8888));
    rig.store.insert("/y.jpg", std::make_shared<Bitmap>(20, 10, PixelFormat::Rgba8888));
    MemoryImageFile file("/img/unknown.jpg");

    EXPECT_EQ(rig.estimator.estimate(file), (400u + 800u) / 2u);
}

TEST(SizeEstimatorTest, FallsBackToConstantOnEmptyCache) {
    EstimatorRig rig;
    MemoryImageFile file("/img/unknown.jpg");
    EXPECT_EQ(rig.estimator.estimate(file), SizeEstimator::kFallbackBytes);
}

/** @brief Degenerate or throwing metadata falls through to the next source */
TEST(SizeEstimatorTest, BadMetadataFallsThrough) {
    EstimatorRig rig;
    rig.metadata.set_dimensions("/img/zero.jpg", 0, 50);
    MemoryImageFile zero("/img/zero.jpg");
    EXPECT_EQ(rig.estimator.estimate(zero), SizeEstimator::kFallbackBytes);

    rig.store.insert("/x.jpg", std::make_shared<Bitmap>(10, 10, PixelFormat::Rgba8888));
    rig.metadata.set_throw(true);
    MemoryImageFile any("/img/any.jpg");
    EXPECT_EQ(rig.estimator.estimate(any), 400u);
}
