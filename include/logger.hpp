// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "ukres_def.hpp"
#include "version.hpp"

#include <functional>

namespace uuidkit {

// Where log lines go
enum LOG_OPTS {
  LOG_DISABLE = 0,
  LOG_SYSLOG = 1,
  LOG_STDOUT = 2,
  LOG_STDERR = 3,
  LOG_FILE = 4,
};

// syslog severities
enum LOG_LVL {
  LL_EMERGENCY = 0,
  LL_ALERT = 1,
  LL_CRITICAL = 2,
  LL_ERROR = 3,
  LL_WARNING = 4,
  LL_NOTICE = 5,
  LL_INFORMATIONAL = 6,
  LL_DEBUG = 7,
  LL_LENGTH,
};

#define printflike(x, y) __attribute__((format(printf, x, y)))

// LOG_FILE expects a path in opts, other modes ignore it. Returns false when
// the output can not be opened.
bool LOG_open(int mode, const char *opts);
void LOG_close();

void LOG_setlevel(int lvl);
int LOG_getlevel();

using LogsAllowedCallback = std::function<bool()>;

// Extra gate checked before each enabled log line, nullptr removes it
void LOG_set_logs_allowed_function(LogsAllowedCallback logs_allowed_function);

bool LOG_is_logging_enabled_for_level(int level);

// Writes one line regardless of the configured level
printflike(2, 3) void olprintfln(int lvl, const char *fmt, ...);

// Arguments are only evaluated when the level is enabled
#define LG_IF_LVL_OK(level, ...)                                               \
  do {                                                                         \
    if (unlikely(uuidkit::LOG_is_logging_enabled_for_level(level))) {          \
      uuidkit::olprintfln(level, __VA_ARGS__);                                 \
    }                                                                          \
  } while (false)

#define LG_ERR(...) LG_IF_LVL_OK(uuidkit::LL_ERROR, __VA_ARGS__)
#define LG_WRN(...) LG_IF_LVL_OK(uuidkit::LL_WARNING, __VA_ARGS__)
#define LG_NTC(...) LG_IF_LVL_OK(uuidkit::LL_NOTICE, __VA_ARGS__)
#define LG_NFO(...) LG_IF_LVL_OK(uuidkit::LL_INFORMATIONAL, __VA_ARGS__)
#define LG_DBG(...) LG_IF_LVL_OK(uuidkit::LL_DEBUG, __VA_ARGS__)
// Always shown, used for explicitly requested output such as --show_config
#define PRINT_NFO(...)                                                         \
  uuidkit::olprintfln(uuidkit::LL_INFORMATIONAL, __VA_ARGS__)

} // namespace uuidkit
