// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "ukres_list.hpp"

#include <array>

namespace {
constexpr std::array<const char *, COMMON_ERROR_SIZE - UK_WHAT_MIN_ERRNO - 1>
    s_common_error_messages = {COMMON_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};

constexpr std::array<const char *, CODEC_ERROR_SIZE - UK_WHAT_MIN_CODEC - 1>
    s_codec_error_messages = {CODEC_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};
} // namespace

const char *ukres_error_message(int16_t what) {
  if (what > UK_WHAT_MIN_ERRNO && what < COMMON_ERROR_SIZE) {
    return s_common_error_messages[what - UK_WHAT_MIN_ERRNO - 1];
  }
  if (what > UK_WHAT_MIN_CODEC && what < CODEC_ERROR_SIZE) {
    return s_codec_error_messages[what - UK_WHAT_MIN_CODEC - 1];
  }
  return "Unknown error. Please update " __FILE__ ".";
}
