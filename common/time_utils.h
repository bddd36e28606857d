#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>

namespace Common {

// Nanoseconds using CLOCK_MONOTONIC, for durations
inline uint64_t getNanosSinceEpoch() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

// Nanoseconds using CLOCK_REALTIME, for log timestamps
inline uint64_t getWallClockNanos() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

// Elapsed milliseconds between two getNanosSinceEpoch() samples
inline double nanosToMillis(uint64_t start_ns, uint64_t end_ns) noexcept {
  return static_cast<double>(end_ns - start_ns) / 1'000'000.0;
}

// Formats the wall clock as YYYYmmdd_HHMMSS into buf
inline void formatFileTimestamp(char* buf, size_t size) noexcept {
  const time_t now = time(nullptr);
  struct tm local_tm;
  localtime_r(&now, &local_tm);
  strftime(buf, size, "%Y%m%d_%H%M%S", &local_tm);
}

} // namespace Common
