// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace uuidkit {

namespace {
constexpr size_t k_log_line_cap = 4096;
// syslog facility "user-level messages"
constexpr int k_syslog_facility_user = 1;

constexpr std::array<const char *, LL_LENGTH> k_level_names = {
    "EMERGENCY", "ALERT",  "CRITICAL",      "ERROR",
    "WARNING",   "NOTICE", "INFORMATIONAL", "DEBUG",
};

struct LoggerContext {
  int fd{STDERR_FILENO};
  int mode{LOG_STDERR};
  int level{LL_ERROR};
  LogsAllowedCallback logs_allowed_function;
};

LoggerContext log_ctx;

int open_syslog_socket() {
  const sockaddr_un sa = {AF_UNIX, "/dev/log"};
  int const fd = socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return -1;
  }
  if (connect(fd, reinterpret_cast<const sockaddr *>(&sa), sizeof(sa)) < 0) {
    close(fd);
    return -1;
  }
  return fd;
}

bool owns_fd(int mode) { return mode == LOG_SYSLOG || mode == LOG_FILE; }

// `<LEVEL>Mon DD hh:mm:ss.uuuuuu uuidkit[pid]: ` or, for syslog, the
// numeric priority in place of the level name
int format_prefix(char *buf, size_t cap, int lvl) {
  auto const since_epoch = std::chrono::system_clock::now().time_since_epoch();
  auto const secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto const usecs =
      std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs);

  time_t const t = secs.count();
  struct tm local;
  localtime_r(&t, &local);
  char stamp[sizeof("Mon DD hh:mm:ss")];
  (void)strftime(stamp, sizeof(stamp), "%b %d %H:%M:%S", &local);

  if (log_ctx.mode == LOG_SYSLOG) {
    return snprintf(buf, cap, "<%d>%s.%06ld " MYNAME "[%d]: ",
                    k_syslog_facility_user * 8 + lvl, stamp,
                    static_cast<long>(usecs.count()), getpid());
  }
  return snprintf(buf, cap, "<%s>%s.%06ld " MYNAME "[%d]: ", k_level_names[lvl],
                  stamp, static_cast<long>(usecs.count()), getpid());
}

void emit(const char *buf, size_t size) {
  ssize_t rc;
  do {
    rc = log_ctx.mode == LOG_SYSLOG
        ? sendto(log_ctx.fd, buf, size, MSG_NOSIGNAL, nullptr, 0)
        : write(log_ctx.fd, buf, size);
  } while (rc < 0 && errno == EINTR);
}
} // namespace

bool LOG_open(int mode, const char *opts) {
  LOG_close();
  log_ctx.mode = mode;
  switch (mode) {
  case LOG_DISABLE:
    log_ctx.fd = -1;
    return true;
  case LOG_SYSLOG:
    log_ctx.fd = open_syslog_socket();
    return log_ctx.fd >= 0;
  case LOG_FILE:
    log_ctx.fd = opts
        ? open(opts, O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644)
        : -1;
    return log_ctx.fd >= 0;
  case LOG_STDERR:
    log_ctx.fd = STDERR_FILENO;
    return true;
  case LOG_STDOUT:
  default:
    log_ctx.mode = LOG_STDOUT;
    log_ctx.fd = STDOUT_FILENO;
    return true;
  }
}

void LOG_close() {
  if (owns_fd(log_ctx.mode) && log_ctx.fd >= 0) {
    close(log_ctx.fd);
  }
  log_ctx.fd = -1;
}

void LOG_setlevel(int lvl) {
  if (lvl >= LL_EMERGENCY && lvl <= LL_DEBUG) {
    log_ctx.level = lvl;
  }
}

int LOG_getlevel() { return log_ctx.level; }

void LOG_set_logs_allowed_function(LogsAllowedCallback logs_allowed_function) {
  log_ctx.logs_allowed_function = std::move(logs_allowed_function);
}

bool LOG_is_logging_enabled_for_level(int level) {
  if (level > log_ctx.level) {
    return false;
  }
  return !log_ctx.logs_allowed_function || log_ctx.logs_allowed_function();
}

// NOLINTNEXTLINE(cert-dcl50-cpp)
void olprintfln(int lvl, const char *fmt, ...) {
  if (log_ctx.fd < 0 || !fmt) {
    return;
  }
  if (lvl < LL_EMERGENCY || lvl >= LL_LENGTH) {
    lvl = log_ctx.level;
  }

  char buf[k_log_line_cap];
  int const prefix = format_prefix(buf, sizeof(buf), lvl);
  if (prefix < 0) {
    return;
  }
  // keep room for the newline and the terminator
  size_t const used = static_cast<size_t>(prefix);
  size_t const room = sizeof(buf) - used - 1;

  va_list args;
  va_start(args, fmt);
  int const body = vsnprintf(&buf[used], room, fmt, args);
  va_end(args);
  if (body < 0) {
    return;
  }
  // truncated messages keep room - 1 characters
  size_t size = used + std::min(static_cast<size_t>(body), room - 1);
  if (log_ctx.mode != LOG_SYSLOG) {
    buf[size++] = '\n';
  }
  emit(buf, size);
}

} // namespace uuidkit
