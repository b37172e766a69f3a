// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "uuidkit_cli.hpp"

#include "CLI/CLI11.hpp"
#include "logger.hpp"
#include "ukres.hpp"
#include "uuid.hpp"
#include "version.hpp"

#include <cstdio>
#include <fstream>

namespace uuidkit {

namespace {
void write_config_file(const CLI::App &app, const std::string &file_path) {
  std::ofstream out_file;
  out_file.open(file_path);
  if (!out_file) {
    // logger is not configured yet
    (void)fprintf(stderr, MYNAME ": cannot open the file %s\n",
                  file_path.c_str());
    return;
  }
  out_file << app.config_to_str(true, true);
  out_file.close();
}
} // namespace

int UuidKitCLI::parse(int argc, const char *argv[]) {
  std::string capture_config;
  CLI::App app{MYNAME " generates RFC 9562 identifiers, random based (v4) or "
                      "time ordered (v7).\n"
                      " eg: " MYNAME " -V 7 -n 10\n",
               MYNAME};

  app.set_config("--config", "", "Read options from a TOML/INI file.")
      ->envname("UUIDKIT_CONFIG");

  app.add_option("--uuid-version,--uuid_version,-V", uuid_version,
                 "Layout of the generated identifiers: 4 (random) or 7 "
                 "(unix epoch time + random).")
      ->default_val(k_default_uuid_version)
      ->check(CLI::IsMember({4, 7}))
      ->envname("UUIDKIT_VERSION");

  app.add_option("--count,-n", count, "Number of identifiers to generate.")
      ->default_val(k_default_uuid_count)
      ->check(CLI::Range(1U, k_max_uuid_count))
      ->envname("UUIDKIT_COUNT");

  CLI::Option *timestamp_opt =
      app.add_option("--timestamp,-t", timestamp_ms,
                     "Creation time in milliseconds since the Unix epoch "
                     "(v7 only). Defaults to the current time.\n"
                     "Only the low 48 bits are used.")
          ->envname("UUIDKIT_TIMESTAMP");

  // debug
  app.add_option("--log_level,--log-level,-l", log_level,
                 "Log level: debug, informational, notice, warn, error.")
      ->default_val("error")
      ->envname("UUIDKIT_LOG_LEVEL")
      ->group("Debug options");

  app.add_option("--log_mode,--log-mode,-o", log_mode,
                 "Log output: stdout, stderr, syslog, disabled or a file "
                 "path.")
      ->default_val("stderr")
      ->envname("UUIDKIT_LOG_MODE")
      ->group("Debug options");

  app.add_flag("--show_config,--show-config", show_config,
               "Log the effective configuration.")
      ->envname("UUIDKIT_SHOW_CONFIG")
      ->group("Debug options");

  app.add_option("--capture_config,--capture-config", capture_config,
                 "Write the effective configuration to the given file.")
      ->group("Debug options");

  app.add_flag("--version,-v", version, "Print the version and exit.")
      ->group("Debug options");

  CLI11_PARSE(app, argc, argv);

  if (!capture_config.empty()) {
    write_config_file(app, capture_config);
  }

  if (version) {
    print_version();
    return static_cast<int>(CLI::ExitCodes::Success);
  }

  has_timestamp = timestamp_opt->count() > 0;
  if (has_timestamp && uuid_version != 7) {
    (void)fprintf(stderr, "--timestamp is only valid with version 7\n");
    return static_cast<int>(CLI::ExitCodes::ValidationError);
  }

  continue_exec = true;
  return static_cast<int>(CLI::ExitCodes::Success);
}

void UuidKitCLI::print() const {
  auto version_str = str_version();
  PRINT_NFO("Version: %.*s", static_cast<int>(version_str.size()),
            version_str.data());
  PRINT_NFO("  - uuid version: %d", uuid_version);
  PRINT_NFO("  - count: %u", count);
  if (has_timestamp) {
    PRINT_NFO("  - timestamp: %llu ms",
              static_cast<unsigned long long>(timestamp_ms));
  } else {
    PRINT_NFO("  - timestamp: now");
  }
  PRINT_NFO("  - log_level: %s", log_level.c_str());
  PRINT_NFO("  - log_mode: %s", log_mode.c_str());
}

UKRes generate_uuids(const UuidKitCLI &cli, SecureRandomSource &random,
                     MillisClock &clock, std::vector<std::string> &uuids) {
  if (cli.count == 0 || cli.count > k_max_uuid_count) {
    UKRES_RETURN_ERROR_LOG(UK_WHAT_ARGUMENT,
                           "Count %u is outside of [1, %u]", cli.count,
                           k_max_uuid_count);
  }
  if (cli.uuid_version != 4 && cli.uuid_version != 7) {
    UKRES_RETURN_ERROR_LOG(UK_WHAT_ARGUMENT, "Unsupported uuid version %d",
                           cli.uuid_version);
  }

  try {
    std::vector<std::string> out;
    out.reserve(cli.count);
    for (unsigned i = 0; i < cli.count; ++i) {
      std::string uuid;
      if (cli.uuid_version == 4) {
        UKRES_CHECK_FWD_STRICT(generate_v4(random, uuid));
      } else if (cli.has_timestamp) {
        UKRES_CHECK_FWD_STRICT(
            generate_v7_from_timestamp(cli.timestamp_ms, random, uuid));
      } else {
        UKRES_CHECK_FWD_STRICT(generate_v7(random, clock, uuid));
      }
      out.push_back(std::move(uuid));
    }
    uuids = std::move(out);
    return {};
  }
  CatchExcept2UKRes();
  return ukres_error(UK_WHAT_UKNW);
}

} // namespace uuidkit
