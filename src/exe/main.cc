// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger.hpp"
#include "logger_setup.hpp"
#include "ukres.hpp"
#include "uuid_sources.hpp"
#include "uuidkit_cli.hpp"

#include <CLI/CLI11.hpp>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace uuidkit;

int main(int argc, char *argv[]) {
  UuidKitCLI cli;
  int const parse_res = cli.parse(argc, const_cast<const char **>(argv));
  if (parse_res != static_cast<int>(CLI::ExitCodes::Success) ||
      !cli.continue_exec) {
    return parse_res;
  }

  if (IsUKResNotOK(
          setup_logger(cli.log_mode.c_str(), cli.log_level.c_str()))) {
    return EXIT_FAILURE;
  }
  if (cli.show_config) {
    cli.print();
  }

  std::vector<std::string> uuids;
  UKRes const res = generate_uuids(cli, default_random_source(),
                                   default_millis_clock(), uuids);
  if (IsUKResNotOK(res)) {
    LG_ERR("Generation failed - %s", ukres_error_message(res._what));
    return EXIT_FAILURE;
  }
  for (const auto &uuid : uuids) {
    printf("%s\n", uuid.c_str());
  }
  LOG_close();
  return EXIT_SUCCESS;
}
