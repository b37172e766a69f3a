// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "hex_formatter.hpp"

#include "ukres.hpp"

#include <algorithm>
#include <numeric>
#include <string_view>

namespace uuidkit {

namespace {
static_assert(std::accumulate(k_uuid_group_nibbles.begin(),
                              k_uuid_group_nibbles.end(), size_t{0}) ==
              k_uuid_nibbles);
static_assert(k_uuid_nibbles + k_uuid_group_nibbles.size() - 1 ==
              k_uuid_string_size);

constexpr bool is_hex_digit(char c) {
  return std::find(k_hex_digits.begin(), k_hex_digits.end(), c) !=
      k_hex_digits.end();
}

// Shape of the assembled text: separators between groups, hex digits
// everywhere else
bool is_canonical_text(std::string_view text) {
  if (text.size() != k_uuid_string_size) {
    return false;
  }
  size_t pos = 0;
  for (size_t group = 0; group < k_uuid_group_nibbles.size(); ++group) {
    if (group != 0 && text[pos++] != k_uuid_separator) {
      return false;
    }
    for (size_t i = 0; i < k_uuid_group_nibbles[group]; ++i) {
      if (!is_hex_digit(text[pos++])) {
        return false;
      }
    }
  }
  return true;
}
} // namespace

std::array<uint8_t, k_uuid_nibbles> split_nibbles(const UuidLayout &layout) {
  std::array<uint8_t, k_uuid_nibbles> nibbles;
  size_t index = 0;
  for (uint8_t const b : layout.bytes) {
    nibbles[index++] = (b >> 4) & 0x0F;
    nibbles[index++] = b & 0x0F;
  }
  return nibbles;
}

UKRes format_nibbles(std::span<const uint8_t> nibbles, std::string &text) {
  if (nibbles.size() != k_uuid_nibbles) {
    UKRES_RETURN_ERROR_LOG(UK_WHAT_MALFORMED_INPUT,
                           "Expected %zu nibbles, got %zu", k_uuid_nibbles,
                           nibbles.size());
  }

  std::array<char, k_uuid_string_size> chars;
  size_t pos = 0;
  size_t nibble_idx = 0;
  for (size_t group = 0; group < k_uuid_group_nibbles.size(); ++group) {
    if (group != 0) {
      chars[pos++] = k_uuid_separator;
    }
    for (size_t i = 0; i < k_uuid_group_nibbles[group]; ++i, ++nibble_idx) {
      std::optional<char> const digit = nibble_to_hex(nibbles[nibble_idx]);
      if (!digit) {
        UKRES_RETURN_ERROR_LOG(UK_WHAT_ENCODING_FAILURE,
                               "No hex digit for nibble value %u at %zu",
                               static_cast<unsigned>(nibbles[nibble_idx]),
                               nibble_idx);
      }
      chars[pos++] = *digit;
    }
  }

  std::string_view const assembled{chars.data(), pos};
  if (!is_canonical_text(assembled)) {
    UKRES_RETURN_ERROR_LOG(UK_WHAT_ENCODING_FAILURE,
                           "Assembled text is not a canonical uuid (%.*s)",
                           static_cast<int>(assembled.size()),
                           assembled.data());
  }
  text.assign(assembled);
  return {};
}

UKRes format(const UuidLayout &layout, std::string &text) {
  auto const nibbles = split_nibbles(layout);
  return format_nibbles(nibbles, text);
}

} // namespace uuidkit
