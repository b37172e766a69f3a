// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "ukres_def.hpp"

#include <cstdint>
#include <span>

namespace uuidkit {

// Cryptographically secure byte source. Implementations must be usable from
// several threads at once.
class SecureRandomSource {
public:
  virtual ~SecureRandomSource() = default;
  // Fills all of `out`, UK_WHAT_RANDOM_SOURCE otherwise
  virtual UKRes next_bytes(std::span<uint8_t> out) = 0;
};

// Kernel CSPRNG through getrandom(2), blocks until the pool is initialized
class GetrandomSource : public SecureRandomSource {
public:
  UKRes next_bytes(std::span<uint8_t> out) override;
};

// Milliseconds since the Unix epoch, no monotonicity guarantee
class MillisClock {
public:
  virtual ~MillisClock() = default;
  virtual UKRes now_millis(uint64_t &millis) = 0;
};

class RealtimeMillisClock : public MillisClock {
public:
  UKRes now_millis(uint64_t &millis) override;
};

// Process wide stateless instances
SecureRandomSource &default_random_source();
MillisClock &default_millis_clock();

} // namespace uuidkit
