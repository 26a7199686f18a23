#include "MemoryBudget.hpp"
#include <algorithm>
#include <sys/sysinfo.h>

// 33 MP at 4 bytes per pixel, in MB.
static const uint64_t kLargeImageMb = 132;
static const uint64_t kFallbackLimitMb = 2048;

namespace MemoryBudget {

uint64_t memory_limit_for_mb(uint64_t physical_mb) {
    if (physical_mb == 0) return kFallbackLimitMb;
    return std::min<uint64_t>(8192, std::max<uint64_t>(512, physical_mb / 2));
}


// Desc: memory the viewer may use, derived from physical RAM
// In: (none)
// Out: uint64_t (MB)
uint64_t app_memory_limit_mb() {
    struct sysinfo si{};
    if (sysinfo(&si) != 0 || si.totalram == 0) return kFallbackLimitMb;
    const uint64_t total = static_cast<uint64_t>(si.totalram) * static_cast<uint64_t>(si.mem_unit);
    return memory_limit_for_mb(total / (1024ULL * 1024ULL));
}


// Desc: cache ceilings for a memory limit
// In: uint64_t limit_mb
// Out: CacheLimits
CacheLimits default_cache_limits(uint64_t limit_mb) {
    CacheLimits lim;
    const uint64_t size_mb = std::max<uint64_t>(512, std::min<uint64_t>(limit_mb / 2, 4096));
    lim.max_size = size_mb * 1024ULL * 1024ULL;
    lim.max_count = size_mb < 4096 ? static_cast<size_t>(std::max<uint64_t>(1, size_mb / kLargeImageMb)) : 30;
    return lim;
}

}
