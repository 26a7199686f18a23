#pragma once
#include <cstdint>
#include "CapacityManager.hpp"

namespace MemoryBudget {

// 50% of physical memory clamped to [512, 8192] MB; 2048 when unknown.
uint64_t app_memory_limit_mb();

// Same rule for an explicit physical size (0 = unknown).
uint64_t memory_limit_for_mb(uint64_t physical_mb);

// max_size = max(512, min(limit / 2, 4096)) MB;
// max_count = max_size_mb / 132 below 4096 MB, 30 otherwise.
CacheLimits default_cache_limits(uint64_t limit_mb);

}
