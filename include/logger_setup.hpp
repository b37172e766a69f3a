// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "ukres_def.hpp"

namespace uuidkit {

// log_mode: stdout, stderr, syslog, disabled or a file path (default stderr)
// log_level: debug, informational, notice, warn, error (default error)
UKRes setup_logger(const char *log_mode, const char *log_level);

} // namespace uuidkit
