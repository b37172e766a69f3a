// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <exception>
#include <new>

#include "ukres_def.hpp"
#include "ukres_helpers.hpp"
#include "ukres_list.hpp"

namespace uuidkit {

/// Standard exception containing a UKRes
class UKException : public std::exception {
public:
  explicit UKException(UKRes ukres) : _ukres(ukres) {}
  UKException(int16_t sev, int16_t what) : _ukres(ukres_create(sev, what)) {}
  [[nodiscard]] UKRes get_UKRes() const { return _ukres; }
  [[nodiscard]] const char *what() const noexcept override {
    return ukres_error_message(_ukres._what);
  }

private:
  UKRes _ukres;
};
} // namespace uuidkit

/// Catch exceptions and convert them back to a result code
#define CatchExcept2UKRes()                                                    \
  catch (const uuidkit::UKException &e) {                                      \
    UKRES_CHECK_FWD(e.get_UKRes());                                            \
  }                                                                            \
  catch (const std::bad_alloc &ba) {                                           \
    LOG_ERROR_DETAILS(LG_ERR, UK_WHAT_BADALLOC);                               \
    return ukres_error(UK_WHAT_BADALLOC);                                      \
  }                                                                            \
  catch (const std::exception &e) {                                            \
    LG_ERR("%s", e.what());                                                    \
    LOG_ERROR_DETAILS(LG_ERR, UK_WHAT_STDEXCEPT);                              \
    return ukres_error(UK_WHAT_STDEXCEPT);                                     \
  }                                                                            \
  catch (...) {                                                                \
    LOG_ERROR_DETAILS(LG_ERR, UK_WHAT_UKNWEXCEPT);                             \
    return ukres_error(UK_WHAT_UKNWEXCEPT);                                    \
  }
