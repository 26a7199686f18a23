#include "SizeEstimator.hpp"
#include <stdexcept>


// Desc: estimated bytes of the decoded bitmap
// In: const ImageFile& file
// Out: uint64_t
uint64_t SizeEstimator::estimate(const ImageFile& file) const noexcept {
    try {
        auto dims = metadata_.get_dimensions(file);
        if (dims && dims->width > 0 && dims->height > 0) {
            const uint64_t bpp = pipeline_.strip_alpha() ? 3 : 4;
            return static_cast<uint64_t>(dims->width) * static_cast<uint64_t>(dims->height) * bpp;
        }
    } catch (const std::exception&) {
        // metadata unreadable: fall through to the cache average
    }

    const CacheStats st = store_.stats();
    if (st.count > 0) return st.size_bytes / st.count;
    return kFallbackBytes;
}
