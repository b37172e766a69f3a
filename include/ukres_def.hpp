// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstdint>

#if defined(__has_builtin)
#  if __has_builtin(__builtin_expect)
#    define likely(x) __builtin_expect(!!(x), 1)
#    define unlikely(x) __builtin_expect(!!(x), 0)
#  endif
#endif
#ifndef likely
#  define likely(x) (x)
#  define unlikely(x) (x)
#endif

// stored in an int16, only needs a uint8
enum UK_RES_SEV : uint8_t {
  UK_SEV_OK = 0,
  UK_SEV_NOTICE = 1,
  UK_SEV_WARN = 2,
  UK_SEV_ERROR = 3,
};

/// Result of a uuidkit operation: a severity and a "what" code
/// (see ukres_list.hpp). Values are returned through output parameters.
struct UKRes {
  union {
    struct {
      int16_t _what; // error code from the ukres_list table
      int16_t _sev;  // UK_RES_SEV
    };
    int32_t _val;
  };
};

#define FillUKRes(res, sev, what)                                              \
  do {                                                                         \
    (res)._sev = (sev);                                                        \
    (res)._what = (what);                                                      \
  } while (0)

#define InitUKResOK(res)                                                       \
  do {                                                                         \
    (res)._val = 0;                                                            \
  } while (0)

/// sev, what
static inline UKRes ukres_create(int16_t sev, int16_t what) {
  UKRes ukres;
  FillUKRes(ukres, sev, what);
  return ukres;
}

/// Error severity result for the given code
static inline UKRes ukres_error(int16_t what) {
  return ukres_create(UK_SEV_ERROR, what);
}

/// Warning severity result for the given code
static inline UKRes ukres_warn(int16_t what) {
  return ukres_create(UK_SEV_WARN, what);
}

/// OK result
static inline UKRes ukres_init() {
  UKRes ukres = {};
  return ukres;
}

static inline bool ukres_equal(UKRes lhs, UKRes rhs) {
  return lhs._val == rhs._val;
}

// Errors are assumed to be the rare path

#define IsUKResNotOK(res) unlikely((res)._sev != UK_SEV_OK)

#define IsUKResOK(res) likely((res)._sev == UK_SEV_OK)

#define IsUKResFatal(res) unlikely((res)._sev == UK_SEV_ERROR)

inline bool operator==(UKRes lhs, UKRes rhs) { return ukres_equal(lhs, rhs); }
