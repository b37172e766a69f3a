// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "loghandle.hpp"
#include "ukres.hpp"
#include "uuid_layout.hpp"

#include <array>
#include <vector>

namespace uuidkit {

namespace {
constexpr std::array<uint8_t, k_uuid_size> k_all_ones = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
constexpr std::array<uint8_t, k_uuid_size> k_all_zeros = {};
constexpr std::array<uint8_t, k_uuid_size> k_counting = {
    0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77,
    0x88, 0x99, 0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF};
} // namespace

TEST(UuidLayout, extract_field) {
  EXPECT_EQ(extract_field(k_counting, k_field_random_head), 0x001122334455UL);
  EXPECT_EQ(extract_field(k_counting, k_field_version), 0x6UL);
  EXPECT_EQ(extract_field(k_counting, k_field_random_a), 0x677UL);
  // 0x88 = 10 001000
  EXPECT_EQ(extract_field(k_counting, k_field_variant), 0x2UL);
  EXPECT_EQ(extract_field(k_counting, k_field_random_b),
            0x0899AABBCCDDEEFFUL);
}

TEST(UuidLayout, deposit_field) {
  std::array<uint8_t, k_uuid_size> bytes = {};
  deposit_field(bytes, k_field_version, 0xA);
  EXPECT_EQ(bytes[6], 0xA0);
  // values wider than the field are masked
  deposit_field(bytes, k_field_variant, 0xFF);
  EXPECT_EQ(bytes[8], 0xC0);
  deposit_field(bytes, k_field_variant, 0x1);
  EXPECT_EQ(bytes[8], 0x40);
  // neighbours untouched
  EXPECT_EQ(bytes[6], 0xA0);
  EXPECT_EQ(bytes[7], 0x00);
  EXPECT_EQ(bytes[9], 0x00);
}

TEST(UuidLayout, v4_markers_on_all_ones) {
  LogHandle handle;
  UuidLayout layout;
  ASSERT_TRUE(IsUKResOK(build_v4(k_all_ones, layout)));
  EXPECT_EQ(layout.version(), 4U);
  EXPECT_EQ(layout.variant_bits(), 2U);
  EXPECT_EQ(layout.bytes[6], 0x4F);
  EXPECT_EQ(layout.bytes[8], 0xBF);
  for (size_t i = 0; i < k_uuid_size; ++i) {
    if (i != 6 && i != 8) {
      EXPECT_EQ(layout.bytes[i], 0xFF) << "byte " << i;
    }
  }
}

TEST(UuidLayout, v4_markers_on_all_zeros) {
  LogHandle handle;
  UuidLayout layout;
  ASSERT_TRUE(IsUKResOK(build_v4(k_all_zeros, layout)));
  EXPECT_EQ(layout.bytes[6], 0x40);
  EXPECT_EQ(layout.bytes[8], 0x80);
}

TEST(UuidLayout, v4_keeps_random_blocks) {
  LogHandle handle;
  UuidLayout layout;
  ASSERT_TRUE(IsUKResOK(build_v4(k_counting, layout)));
  EXPECT_EQ(extract_field(layout.bytes, k_field_random_head),
            extract_field(k_counting, k_field_random_head));
  EXPECT_EQ(extract_field(layout.bytes, k_field_random_a),
            extract_field(k_counting, k_field_random_a));
  EXPECT_EQ(extract_field(layout.bytes, k_field_random_b),
            extract_field(k_counting, k_field_random_b));
  EXPECT_EQ(layout.version(), 4U);
}

TEST(UuidLayout, v7_timestamp_prefix) {
  LogHandle handle;
  UuidLayout layout;
  constexpr uint64_t k_ts = 1700000000000UL; // 0x018BCFE56800
  ASSERT_TRUE(IsUKResOK(build_v7(k_ts, k_all_ones, layout)));
  EXPECT_EQ(layout.timestamp_ms(), k_ts);
  const std::array<uint8_t, 6> expected_prefix = {0x01, 0x8B, 0xCF,
                                                  0xE5, 0x68, 0x00};
  for (size_t i = 0; i < expected_prefix.size(); ++i) {
    EXPECT_EQ(layout.bytes[i], expected_prefix[i]) << "byte " << i;
  }
  EXPECT_EQ(layout.version(), 7U);
  EXPECT_EQ(layout.variant_bits(), 2U);
  EXPECT_EQ(layout.bytes[6], 0x7F);
  EXPECT_EQ(layout.bytes[8], 0xBF);
}

TEST(UuidLayout, v7_discards_leading_entropy) {
  LogHandle handle;
  std::array<uint8_t, k_uuid_size> entropy_a = k_counting;
  std::array<uint8_t, k_uuid_size> entropy_b = k_counting;
  // only the first 48 bits differ
  for (size_t i = 0; i < 6; ++i) {
    entropy_b[i] = ~entropy_a[i];
  }
  UuidLayout layout_a;
  UuidLayout layout_b;
  ASSERT_TRUE(IsUKResOK(build_v7(42, entropy_a, layout_a)));
  ASSERT_TRUE(IsUKResOK(build_v7(42, entropy_b, layout_b)));
  EXPECT_EQ(layout_a, layout_b);
  EXPECT_EQ(extract_field(layout_a.bytes, k_field_random_a), 0x677UL);
  EXPECT_EQ(extract_field(layout_a.bytes, k_field_random_b),
            0x0899AABBCCDDEEFFUL);
}

TEST(UuidLayout, v7_timestamp_truncated_to_48_bits) {
  LogHandle handle;
  UuidLayout layout;
  constexpr uint64_t k_ts = (uint64_t{1} << 48) + 5;
  ASSERT_TRUE(IsUKResOK(build_v7(k_ts, k_all_zeros, layout)));
  EXPECT_EQ(layout.timestamp_ms(), 5U);

  ASSERT_TRUE(IsUKResOK(build_v7(UINT64_MAX, k_all_zeros, layout)));
  EXPECT_EQ(layout.timestamp_ms(), k_timestamp_mask);
  EXPECT_EQ(layout.version(), 7U);
}

TEST(UuidLayout, malformed_entropy) {
  LogHandle handle;
  UuidLayout layout;
  layout.bytes.fill(0x5A);
  const std::vector<uint8_t> short_entropy(15, 0xFF);
  const std::vector<uint8_t> long_entropy(17, 0xFF);
  EXPECT_EQ(build_v4(short_entropy, layout),
            ukres_error(UK_WHAT_MALFORMED_INPUT));
  EXPECT_EQ(build_v4(long_entropy, layout),
            ukres_error(UK_WHAT_MALFORMED_INPUT));
  EXPECT_EQ(build_v7(0, std::span<const uint8_t>{}, layout),
            ukres_error(UK_WHAT_MALFORMED_INPUT));
  // output untouched on failure
  EXPECT_EQ(layout.bytes[0], 0x5A);
}

} // namespace uuidkit
