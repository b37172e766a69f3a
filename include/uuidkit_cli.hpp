// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "ukres_def.hpp"
#include "uuid_sources.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace uuidkit {

inline constexpr int k_default_uuid_version = 4;
inline constexpr unsigned k_default_uuid_count = 1;
inline constexpr unsigned k_max_uuid_count = 1000000;

// Options of the uuidkit tool. Each option can also come from the
// environment or from a configuration file.
struct UuidKitCLI {
public:
  // Returns a CLI::ExitCodes value, continue_exec tells whether uuids should
  // be generated
  int parse(int argc, const char *argv[]);

  void print() const;

  int uuid_version{k_default_uuid_version};
  unsigned count{k_default_uuid_count};
  bool has_timestamp{false};
  uint64_t timestamp_ms{0};

  // debug
  std::string log_level;
  std::string log_mode;
  bool show_config{false};
  bool version{false}; // request version

  bool continue_exec{false};
};

// Generates cli.count identifiers of the requested version, between 1 and
// k_max_uuid_count
UKRes generate_uuids(const UuidKitCLI &cli, SecureRandomSource &random,
                     MillisClock &clock, std::vector<std::string> &uuids);

} // namespace uuidkit
