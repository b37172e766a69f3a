// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "uuidkit_cmdline.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace uuidkit {

int arg_which(std::string_view str, std::span<const std::string_view> str_set) {
  auto it = std::ranges::find_if(str_set, [&str](std::string_view s) {
    return std::ranges::equal(str, s, [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a)) ==
          std::tolower(static_cast<unsigned char>(b));
    });
  });
  return (it == str_set.end())
      ? -1
      : static_cast<int>(std::distance(str_set.begin(), it));
}

} // namespace uuidkit
