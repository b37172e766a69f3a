// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "ukres_def.hpp"
#include "uuid_layout.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace uuidkit {

inline constexpr size_t k_uuid_nibbles = 2 * k_uuid_size;
// 32 hex digits and 4 separators
inline constexpr size_t k_uuid_string_size = 36;
inline constexpr char k_uuid_separator = '-';
// 8-4-4-4-12
inline constexpr std::array<size_t, 5> k_uuid_group_nibbles = {8, 4, 4, 4, 12};

inline constexpr std::array<char, 16> k_hex_digits = {
    '0', '1', '2', '3', '4', '5', '6', '7',
    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

/// Lowercase hex digit of a 4 bit value. No value outside of [0, 15].
constexpr std::optional<char> nibble_to_hex(uint8_t nibble) {
  if (nibble >= k_hex_digits.size()) {
    return std::nullopt;
  }
  return k_hex_digits[nibble];
}

/// 32 nibbles of the layout, most significant first
std::array<uint8_t, k_uuid_nibbles> split_nibbles(const UuidLayout &layout);

/// Canonical 8-4-4-4-12 text from a sequence of 32 nibbles.
/// UK_WHAT_MALFORMED_INPUT if there are not 32 nibbles,
/// UK_WHAT_ENCODING_FAILURE if a character can not be produced.
UKRes format_nibbles(std::span<const uint8_t> nibbles, std::string &text);

/// Canonical lowercase text of the layout, always 36 characters
UKRes format(const UuidLayout &layout, std::string &text);

} // namespace uuidkit
