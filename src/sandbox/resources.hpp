#pragma once

#include <cstdint>
#include <string_view>

namespace runbox::sandbox {

inline constexpr std::int64_t kDefaultMemoryBytes = 1024LL * 1024 * 1024;
inline constexpr double kDefaultCpus = 2.0;

// "1g", "512m", "64k" or plain bytes; suffixes are powers of 1024 and case-insensitive.
// Empty or malformed input yields 1 GiB.
std::int64_t ParseMemory(std::string_view value);

// Decimal core count. Empty, non-positive or malformed input yields 2.
double ParseCpu(std::string_view value);

// Docker NanoCpus for a core count, rounded down to whole cores (at least one).
std::int64_t CpuNanoQuota(double cpus);

}  // namespace runbox::sandbox
