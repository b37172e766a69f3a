// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "uuid.hpp"

#include "hex_formatter.hpp"
#include "ukres.hpp"

#include <array>

namespace uuidkit {

namespace {
using RandomBits = std::array<uint8_t, k_uuid_size>;

UKRes draw_random_bits(SecureRandomSource &random, RandomBits &bits) {
  UKRes const res = random.next_bytes(bits);
  if (IsUKResNotOK(res)) {
    LG_ERR("Unable to draw %zu bytes of entropy - %s", bits.size(),
           ukres_error_message(res._what));
  }
  return res;
}

UKRes layout_to_uuid(const UuidLayout &layout, std::string &uuid) {
  std::string text;
  UKRES_CHECK_FWD_STRICT(format(layout, text));
  LG_DBG("uuid v%u: %s", layout.version(), text.c_str());
  uuid = std::move(text);
  return {};
}
} // namespace

UKRes generate_v4_layout(SecureRandomSource &random, UuidLayout &layout) {
  try {
    RandomBits bits;
    UKRES_CHECK_FWD_STRICT(draw_random_bits(random, bits));
    return build_v4(bits, layout);
  }
  CatchExcept2UKRes();
  return ukres_error(UK_WHAT_UKNW);
}

UKRes generate_v7_layout(uint64_t timestamp_ms, SecureRandomSource &random,
                         UuidLayout &layout) {
  try {
    RandomBits bits;
    UKRES_CHECK_FWD_STRICT(draw_random_bits(random, bits));
    return build_v7(timestamp_ms, bits, layout);
  }
  CatchExcept2UKRes();
  return ukres_error(UK_WHAT_UKNW);
}

UKRes generate_v4(SecureRandomSource &random, std::string &uuid) {
  try {
    UuidLayout layout;
    UKRES_CHECK_FWD_STRICT(generate_v4_layout(random, layout));
    return layout_to_uuid(layout, uuid);
  }
  CatchExcept2UKRes();
  return ukres_error(UK_WHAT_UKNW);
}

UKRes generate_v4(std::string &uuid) {
  return generate_v4(default_random_source(), uuid);
}

UKRes generate_v7_from_timestamp(uint64_t timestamp_ms,
                                 SecureRandomSource &random,
                                 std::string &uuid) {
  try {
    UuidLayout layout;
    UKRES_CHECK_FWD_STRICT(generate_v7_layout(timestamp_ms, random, layout));
    return layout_to_uuid(layout, uuid);
  }
  CatchExcept2UKRes();
  return ukres_error(UK_WHAT_UKNW);
}

UKRes generate_v7_from_timestamp(uint64_t timestamp_ms, std::string &uuid) {
  return generate_v7_from_timestamp(timestamp_ms, default_random_source(),
                                    uuid);
}

UKRes generate_v7(SecureRandomSource &random, MillisClock &clock,
                  std::string &uuid) {
  try {
    uint64_t now_ms = 0;
    UKRes const res = clock.now_millis(now_ms);
    if (IsUKResNotOK(res)) {
      LG_ERR("Unable to read the clock - %s", ukres_error_message(res._what));
      return res;
    }
    return generate_v7_from_timestamp(now_ms, random, uuid);
  }
  CatchExcept2UKRes();
  return ukres_error(UK_WHAT_UKNW);
}

UKRes generate_v7(std::string &uuid) {
  return generate_v7(default_random_source(), default_millis_clock(), uuid);
}

} // namespace uuidkit
