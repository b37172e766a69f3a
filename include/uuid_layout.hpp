// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "ukres_def.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace uuidkit {

inline constexpr size_t k_uuid_size = 16;
inline constexpr unsigned k_uuid_bits = 128;

// Field of the 128 bit layout. Offsets count from the most significant bit of
// byte 0 (network order).
struct BitField {
  unsigned offset;
  unsigned width;
};

// RFC 9562 field positions shared by v4 and v7
//
//  0                   1                   2                   3
//  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                     random_head / unix_ts_ms                  |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |  random_head / unix_ts_ms     |  ver  |       random_a        |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |var|                        random_b                           |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
// |                            random_b                           |
// +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
inline constexpr BitField k_field_random_head{0, 48};
inline constexpr BitField k_field_timestamp{0, 48};
inline constexpr BitField k_field_version{48, 4};
inline constexpr BitField k_field_random_a{52, 12};
inline constexpr BitField k_field_variant{64, 2};
inline constexpr BitField k_field_random_b{66, 62};

inline constexpr uint64_t k_version_random = 0x4;       // 0100
inline constexpr uint64_t k_version_unix_epoch = 0x7;   // 0111
inline constexpr uint64_t k_variant_rfc = 0x2;          // 10
inline constexpr uint64_t k_timestamp_mask = (uint64_t{1} << 48) - 1;

/// 128 bit UUID value, big-endian
struct UuidLayout {
  std::array<uint8_t, k_uuid_size> bytes{};

  [[nodiscard]] unsigned version() const;
  [[nodiscard]] unsigned variant_bits() const;
  // leading 48 bits, the creation time of a v7 layout
  [[nodiscard]] uint64_t timestamp_ms() const;
};

inline bool operator==(const UuidLayout &lhs, const UuidLayout &rhs) {
  return lhs.bytes == rhs.bytes;
}

// Big-endian bit field access. Fields must lie inside the 128 bits and be at
// most 64 bits wide.
uint64_t extract_field(std::span<const uint8_t, k_uuid_size> bytes,
                       BitField field);
void deposit_field(std::span<uint8_t, k_uuid_size> bytes, BitField field,
                   uint64_t value);

/// Random based layout from 16 bytes of entropy. Entropy bits found at the
/// version and variant positions are dropped.
UKRes build_v4(std::span<const uint8_t> random, UuidLayout &layout);

/// Time ordered layout: the low 48 bits of timestamp_ms followed by the
/// random_a and random_b blocks of the 16 bytes of entropy. The leading 54
/// entropy bits are not used.
UKRes build_v7(uint64_t timestamp_ms, std::span<const uint8_t> random,
               UuidLayout &layout);

} // namespace uuidkit
