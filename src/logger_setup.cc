// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger_setup.hpp"

#include "logger.hpp"
#include "ukres.hpp"
#include "uuidkit_cmdline.hpp"

#include <string_view>

namespace uuidkit {

UKRes setup_logger(const char *log_mode, const char *log_level) {
  static constexpr std::string_view logpattern[] = {"stdout", "stderr",
                                                    "syslog", "disabled"};
  int const idx_log_mode =
      (log_mode && *log_mode) ? arg_which(log_mode, logpattern) : 1;
  bool opened = false;
  switch (idx_log_mode) {
  case 0:
    opened = LOG_open(LOG_STDOUT, "");
    break;
  case 1:
    opened = LOG_open(LOG_STDERR, "");
    break;
  case 2:
    opened = LOG_open(LOG_SYSLOG, "");
    break;
  case 3:
    opened = LOG_open(LOG_DISABLE, "");
    break;
  default:
    opened = LOG_open(LOG_FILE, log_mode);
    break;
  }
  if (!opened) {
    // fall back so that the failure itself is visible
    (void)LOG_open(LOG_STDERR, "");
    UKRES_RETURN_ERROR_LOG(UK_WHAT_ARGUMENT, "Unable to open log output %s",
                           log_mode);
  }

  static constexpr std::string_view loglpattern[] = {
      "debug", "informational", "notice", "warn", "error"};
  int const idx_log_level =
      log_level ? arg_which(log_level, loglpattern) : -1;
  switch (idx_log_level) {
  case 0:
    LOG_setlevel(LL_DEBUG);
    break;
  case 1:
    LOG_setlevel(LL_INFORMATIONAL);
    break;
  case 2:
    LOG_setlevel(LL_NOTICE);
    break;
  case 3:
    LOG_setlevel(LL_WARNING);
    break;
  case 4:
  case -1: // default
  default:
    LOG_setlevel(LL_ERROR);
    break;
  }
  return {};
}

} // namespace uuidkit
