// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <climits>
#include <cstdint>

enum : uint16_t { UK_COMMON_START_RANGE = 1000, UK_CODEC_START_RANGE = 2000 };

#define EXPAND_ENUM(a, b) UK_WHAT_##a,
#define EXPAND_ERROR_MESSAGE(a, b) #a ": " b,

#define COMMON_ERROR_TABLE(X)                                                  \
  X(UKNW, "undocumented error")                                                \
  X(BADALLOC, "allocation error")                                              \
  X(STDEXCEPT, "standard exception caught")                                    \
  X(UKNWEXCEPT, "unknown exception caught")

#define CODEC_ERROR_TABLE(X)                                                   \
  X(MALFORMED_INPUT, "input does not have the 16 byte / 32 nibble shape")      \
  X(ENCODING_FAILURE, "unable to produce canonical uuid text")                 \
  X(RANDOM_SOURCE, "secure random source failed to deliver bytes")             \
  X(CLOCK, "unable to read the wall clock")                                    \
  X(ARGUMENT, "invalid argument")                                              \
  X(UNITTEST, "unit test error")

enum UKRes_What : uint16_t {
  UK_WHAT_MIN_ERRNO = UK_COMMON_START_RANGE,
  COMMON_ERROR_TABLE(EXPAND_ENUM) COMMON_ERROR_SIZE,
  UK_WHAT_MIN_CODEC = UK_CODEC_START_RANGE,
  CODEC_ERROR_TABLE(EXPAND_ENUM) CODEC_ERROR_SIZE,
  UK_WHAT_MAX = SHRT_MAX,
};

/// Retrieve an explicit error message matching the error ID (from table above)
const char *ukres_error_message(int16_t what);
