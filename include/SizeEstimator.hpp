#pragma once
#include <cstdint>
#include "CacheStore.hpp"
#include "DecodePipeline.hpp"
#include "ImageFile.hpp"
#include "MetadataProvider.hpp"

// Predicts the decoded footprint of a file before decoding it.
// Preference: metadata dimensions, then the average cached entry, then a constant.
class SizeEstimator {
public:
    static constexpr uint64_t kFallbackBytes = 100ULL * 1024ULL * 1024ULL;

    SizeEstimator(MetadataProvider& metadata, const CacheStore& store, const DecodePipeline& pipeline)
        : metadata_(metadata), store_(store), pipeline_(pipeline) {}

    uint64_t estimate(const ImageFile& file) const noexcept;

private:
    MetadataProvider& metadata_;
    const CacheStore& store_;
    const DecodePipeline& pipeline_;
};
