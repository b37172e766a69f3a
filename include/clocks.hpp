// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <chrono>
#include <time.h>

namespace uuidkit {

constexpr std::chrono::nanoseconds timespec_to_duration(timespec ts) {
  return std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec};
}

// Wall clock relative to the Unix epoch. Not monotonic: it follows settimeofday
// and NTP adjustments.
struct RealtimeClock {
  using duration = std::chrono::nanoseconds;
  using rep = duration::rep;
  using period = duration::period;
  using time_point = std::chrono::time_point<RealtimeClock, duration>;

  static constexpr bool is_steady = false;

  // Returns false when the clock cannot be read
  static bool now(time_point &tp) noexcept {
    timespec ts;
    if (clock_gettime(CLOCK_REALTIME, &ts) == -1) {
      return false;
    }
    tp = time_point(timespec_to_duration(ts));
    return true;
  }
};

} // namespace uuidkit
