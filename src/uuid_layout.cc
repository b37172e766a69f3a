// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "uuid_layout.hpp"

#include "ukres.hpp"

namespace uuidkit {

namespace {
__extension__ using uint128 = unsigned __int128;

uint128 load_be(std::span<const uint8_t, k_uuid_size> bytes) {
  uint128 value = 0;
  for (uint8_t const b : bytes) {
    value = (value << 8) | b;
  }
  return value;
}

void store_be(uint128 value, std::span<uint8_t, k_uuid_size> bytes) {
  for (size_t i = k_uuid_size; i > 0; --i) {
    bytes[i - 1] = static_cast<uint8_t>(value & 0xFF);
    value >>= 8;
  }
}

constexpr uint64_t field_mask(BitField field) {
  return field.width >= 64 ? ~uint64_t{0} : (uint64_t{1} << field.width) - 1;
}

constexpr unsigned field_shift(BitField field) {
  return k_uuid_bits - field.offset - field.width;
}

static_assert(k_field_random_head.width + k_field_version.width +
                      k_field_random_a.width + k_field_variant.width +
                      k_field_random_b.width ==
                  k_uuid_bits,
              "v4 fields must cover the 128 bits");
static_assert(k_field_random_b.offset + k_field_random_b.width == k_uuid_bits);

void copy_field(std::span<const uint8_t, k_uuid_size> src, UuidLayout &dst,
                BitField field) {
  deposit_field(dst.bytes, field, extract_field(src, field));
}

// Single place where marker bits are written
void splice_markers(UuidLayout &layout, uint64_t version) {
  deposit_field(layout.bytes, k_field_version, version);
  deposit_field(layout.bytes, k_field_variant, k_variant_rfc);
}

UKRes check_entropy_shape(std::span<const uint8_t> random) {
  if (random.size() != k_uuid_size) {
    UKRES_RETURN_ERROR_LOG(UK_WHAT_MALFORMED_INPUT,
                           "Expected %zu bytes of entropy, got %zu",
                           k_uuid_size, random.size());
  }
  return {};
}
} // namespace

uint64_t extract_field(std::span<const uint8_t, k_uuid_size> bytes,
                       BitField field) {
  return static_cast<uint64_t>(load_be(bytes) >> field_shift(field)) &
      field_mask(field);
}

void deposit_field(std::span<uint8_t, k_uuid_size> bytes, BitField field,
                   uint64_t value) {
  uint128 const mask = static_cast<uint128>(field_mask(field))
      << field_shift(field);
  uint128 v = load_be(bytes);
  v = (v & ~mask) |
      (static_cast<uint128>(value & field_mask(field)) << field_shift(field));
  store_be(v, bytes);
}

unsigned UuidLayout::version() const {
  return static_cast<unsigned>(extract_field(bytes, k_field_version));
}

unsigned UuidLayout::variant_bits() const {
  return static_cast<unsigned>(extract_field(bytes, k_field_variant));
}

uint64_t UuidLayout::timestamp_ms() const {
  return extract_field(bytes, k_field_timestamp);
}

UKRes build_v4(std::span<const uint8_t> random, UuidLayout &layout) {
  UKRES_CHECK_FWD(check_entropy_shape(random));
  std::span<const uint8_t, k_uuid_size> const src{random.data(), k_uuid_size};

  UuidLayout out;
  copy_field(src, out, k_field_random_head);
  copy_field(src, out, k_field_random_a);
  copy_field(src, out, k_field_random_b);
  splice_markers(out, k_version_random);
  layout = out;
  return {};
}

UKRes build_v7(uint64_t timestamp_ms, std::span<const uint8_t> random,
               UuidLayout &layout) {
  UKRES_CHECK_FWD(check_entropy_shape(random));
  std::span<const uint8_t, k_uuid_size> const src{random.data(), k_uuid_size};

  UuidLayout out;
  // values of 2^48 ms and above wrap, year 10889 is far enough
  deposit_field(out.bytes, k_field_timestamp, timestamp_ms & k_timestamp_mask);
  copy_field(src, out, k_field_random_a);
  copy_field(src, out, k_field_random_b);
  splice_markers(out, k_version_unix_epoch);
  layout = out;
  return {};
}

} // namespace uuidkit
