// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "uuid_sources.hpp"

#include "clocks.hpp"
#include "ukres.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sys/random.h>

namespace uuidkit {

UKRes GetrandomSource::next_bytes(std::span<uint8_t> out) {
  size_t filled = 0;
  while (filled < out.size()) {
    ssize_t const rc = getrandom(out.data() + filled, out.size() - filled, 0);
    if (rc == -1) {
      if (errno == EINTR) {
        continue;
      }
      UKRES_CHECK_ERRNO(rc, UK_WHAT_RANDOM_SOURCE,
                        "getrandom failed after %zu of %zu bytes", filled,
                        out.size());
    }
    filled += static_cast<size_t>(rc);
  }
  return {};
}

UKRes RealtimeMillisClock::now_millis(uint64_t &millis) {
  RealtimeClock::time_point now;
  UKRES_CHECK_BOOL(RealtimeClock::now(now), UK_WHAT_CLOCK,
                   "clock_gettime(CLOCK_REALTIME) failed: %s", strerror(errno));
  auto const since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          now.time_since_epoch());
  if (since_epoch.count() < 0) {
    UKRES_RETURN_ERROR_LOG(UK_WHAT_CLOCK,
                           "Wall clock is before the epoch (%lld ms)",
                           static_cast<long long>(since_epoch.count()));
  }
  millis = static_cast<uint64_t>(since_epoch.count());
  return {};
}

SecureRandomSource &default_random_source() {
  static GetrandomSource s_source;
  return s_source;
}

MillisClock &default_millis_clock() {
  static RealtimeMillisClock s_clock;
  return s_clock;
}

} // namespace uuidkit
