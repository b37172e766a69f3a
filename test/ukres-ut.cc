// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "loghandle.hpp"
#include "ukres.hpp"

#include <cerrno>
#include <new>
#include <stdexcept>
#include <string_view>

namespace uuidkit {

TEST(UKRes, Size) {
  UKRes ukres = {};
  ASSERT_TRUE(sizeof(ukres) == sizeof(int32_t));
}

TEST(UKRes, InitOK) {
  UKRes ukres1 = {};
  UKRes ukres2 = ukres_init();
  UKRes ukres3;
  InitUKResOK(ukres3);

  ASSERT_TRUE(ukres_equal(ukres1, ukres2));
  ASSERT_TRUE(ukres_equal(ukres1, ukres3));

  ASSERT_FALSE(IsUKResNotOK(ukres2));
  ASSERT_TRUE(IsUKResOK(ukres2));
}

TEST(UKRes, ErrorMessages) {
  EXPECT_EQ(std::string_view(ukres_error_message(UK_WHAT_MALFORMED_INPUT))
                .substr(0, 15),
            "MALFORMED_INPUT");
  EXPECT_EQ(std::string_view(ukres_error_message(UK_WHAT_ENCODING_FAILURE))
                .substr(0, 16),
            "ENCODING_FAILURE");
  EXPECT_EQ(std::string_view(ukres_error_message(UK_WHAT_BADALLOC)),
            "BADALLOC: allocation error");
  EXPECT_TRUE(std::string_view(ukres_error_message(UK_WHAT_MAX))
                  .starts_with("Unknown error"));
}

namespace {
int s_call_counter = 0;

UKRes mock_fatal_generator() {
  ++s_call_counter;
  UKRES_RETURN_ERROR_LOG(UK_WHAT_UNITTEST,
                         "Test the log and return function %d", 42);
}

UKRes mock_warn_generator() {
  UKRES_RETURN_WARN_LOG(UK_WHAT_UNITTEST, "Only a warning");
}

UKRes ukerr_wrapper() {
  UKRES_CHECK_FWD(mock_fatal_generator());
  return ukres_init();
}

UKRes ukwarn_wrapper() {
  UKRES_CHECK_FWD(mock_warn_generator());
  return ukres_init();
}

UKRes ukwarn_strict_wrapper() {
  UKRES_CHECK_FWD_STRICT(mock_warn_generator());
  return ukres_init();
}

int minus_one_generator() {
  errno = EINVAL;
  return -1;
}

bool false_generator() { return false; }

void mock_except1() { throw UKException(UK_SEV_ERROR, UK_WHAT_UNITTEST); }

void mock_except2() { throw std::bad_alloc(); }

void mock_except3() { throw std::runtime_error("runtime"); }

UKRes mock_wrapper(int idx) {
  try {
    if (idx == 1) {
      mock_except1();
    } else if (idx == 2) {
      mock_except2();
    } else if (idx == 3) {
      UKRES_CHECK_ERRNO(minus_one_generator(), UK_WHAT_UNITTEST,
                        "minus one returned");
    } else if (idx == 4) {
      LG_NTC("all good");
    } else if (idx == 5) {
      UKRES_CHECK_BOOL(false_generator(), UK_WHAT_UNITTEST,
                       "False returned from generator");
    } else if (idx == 6) {
      mock_except3();
    }
  }
  CatchExcept2UKRes();
  return ukres_init();
}
} // namespace

TEST(UKRes, FillFatal) {
  {
    UKRes ukres = ukres_error(UK_WHAT_UNITTEST);
    ASSERT_TRUE(IsUKResNotOK(ukres));
    ASSERT_TRUE(IsUKResFatal(ukres));
  }
  {
    LogHandle handle;
    {
      UKRes ukres = mock_fatal_generator();
      ASSERT_TRUE(ukres_equal(ukres, ukres_error(UK_WHAT_UNITTEST)));
    }
    EXPECT_EQ(s_call_counter, 1);

    {
      UKRes ukres = ukerr_wrapper();
      ASSERT_TRUE(ukres_equal(ukres, ukres_error(UK_WHAT_UNITTEST)));
    }
    EXPECT_EQ(s_call_counter, 2);
  }
}

TEST(UKRes, ForwardWarnings) {
  LogHandle handle;
  // warnings are logged and swallowed by the lenient forward
  EXPECT_TRUE(IsUKResOK(ukwarn_wrapper()));
  EXPECT_EQ(ukwarn_strict_wrapper(), ukres_warn(UK_WHAT_UNITTEST));
}

// Check that an exception can be caught and converted back to a result
TEST(UKRes, ConvertException) {
  LogHandle handle;
  UKRes ukres = mock_wrapper(1);
  ASSERT_EQ(ukres, ukres_create(UK_SEV_ERROR, UK_WHAT_UNITTEST));
  ukres = mock_wrapper(2);
  ASSERT_EQ(ukres, ukres_create(UK_SEV_ERROR, UK_WHAT_BADALLOC));
  ukres = mock_wrapper(3);
  ASSERT_EQ(ukres, ukres_create(UK_SEV_ERROR, UK_WHAT_UNITTEST));
  ukres = mock_wrapper(4);
  ASSERT_TRUE(IsUKResOK(ukres));
  ukres = mock_wrapper(5);
  ASSERT_EQ(ukres, ukres_create(UK_SEV_ERROR, UK_WHAT_UNITTEST));
  ukres = mock_wrapper(6);
  ASSERT_EQ(ukres, ukres_create(UK_SEV_ERROR, UK_WHAT_STDEXCEPT));
}

TEST(UKRes, ExceptionWhat) {
  UKException const e(ukres_error(UK_WHAT_CLOCK));
  EXPECT_TRUE(std::string_view(e.what()).starts_with("CLOCK"));
  EXPECT_EQ(e.get_UKRes(), ukres_error(UK_WHAT_CLOCK));
}

} // namespace uuidkit
