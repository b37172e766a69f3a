// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "logger.hpp"
#include "ukres_def.hpp"
#include "ukres_list.hpp"

#include <cerrno>
#include <cstring>

namespace uuidkit {

/// Standardized way of formatting error log
#define LOG_ERROR_DETAILS(log_func, what)                                      \
  log_func("%s at %s:%u", ukres_error_message(what), __FILE__, __LINE__);

/// Returns an error ukres after logging through LG_ERR
#define UKRES_RETURN_ERROR_LOG(what, ...)                                      \
  do {                                                                         \
    LG_ERR(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_ERR, what);                                           \
    return ukres_error(what);                                                  \
  } while (0)

/// Returns a warning ukres after logging through LG_WRN
#define UKRES_RETURN_WARN_LOG(what, ...)                                       \
  do {                                                                         \
    LG_WRN(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_WRN, what);                                           \
    return ukres_warn(what);                                                   \
  } while (0)

/// Evaluate and return error if -1, logging errno
#define UKRES_CHECK_ERRNO(eval, what, ...)                                     \
  do {                                                                         \
    if (unlikely((eval) == -1)) {                                              \
      const int e = errno;                                                     \
      LG_ERR(__VA_ARGS__);                                                     \
      LOG_ERROR_DETAILS(LG_ERR, what);                                         \
      LG_ERR("errno(%d): %s", e, strerror(e));                                 \
      return ukres_error(what);                                                \
    }                                                                          \
  } while (0)

/// Check boolean and log
#define UKRES_CHECK_BOOL(eval, what, ...)                                      \
  do {                                                                         \
    if (unlikely(!(eval))) {                                                   \
      UKRES_RETURN_ERROR_LOG(what, __VA_ARGS__);                               \
    }                                                                          \
  } while (0)

inline int ukres_sev_to_log_level(int sev) {
  switch (sev) {
  case UK_SEV_ERROR:
    return LL_ERROR;
  case UK_SEV_WARN:
    return LL_WARNING;
  case UK_SEV_NOTICE:
    return LL_DEBUG;
  default: // no log
    return LL_LENGTH;
  }
}

/// Forward any result that is not OK
#define UKRES_CHECK_FWD_STRICT(ukres)                                          \
  do {                                                                         \
    UKRes lukres = ukres; /* single eval */                                    \
    if (IsUKResNotOK(lukres)) {                                                \
      LG_IF_LVL_OK(ukres_sev_to_log_level(lukres._sev),                        \
                   "Forward error at %s:%u - %s", __FILE__, __LINE__,          \
                   ukres_error_message(lukres._what));                         \
      return lukres;                                                           \
    }                                                                          \
  } while (0)

/// Forward result if fatal, log and continue otherwise
#define UKRES_CHECK_FWD(ukres)                                                 \
  do {                                                                         \
    UKRes lukres = ukres; /* single eval */                                    \
    if (IsUKResNotOK(lukres)) {                                                \
      if (IsUKResFatal(lukres)) {                                              \
        LG_ERR("Forward error at %s:%u - %s", __FILE__, __LINE__,              \
               ukres_error_message(lukres._what));                             \
        return lukres;                                                         \
      }                                                                        \
      if (lukres._sev == UK_SEV_WARN) {                                        \
        LG_WRN("Recover from sev=%d at %s:%u - %s", lukres._sev, __FILE__,     \
               __LINE__, ukres_error_message(lukres._what));                   \
      } else {                                                                 \
        LG_NTC("Recover from sev=%d at %s:%u - %s", lukres._sev, __FILE__,     \
               __LINE__, ukres_error_message(lukres._what));                   \
      }                                                                        \
    }                                                                          \
  } while (0)

} // namespace uuidkit
