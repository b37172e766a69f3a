// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "ukres_def.hpp"
#include "uuid_layout.hpp"
#include "uuid_sources.hpp"

#include <cstdint>
#include <string>

namespace uuidkit {

// Canonical uuid generation. Every call draws fresh entropy and keeps no
// state, so calls can be issued concurrently. `uuid` is only written on
// success. Errors:
//  - UK_WHAT_MALFORMED_INPUT, UK_WHAT_ENCODING_FAILURE from the codec
//  - UK_WHAT_RANDOM_SOURCE, UK_WHAT_CLOCK from the collaborators

// eg: f47ac10b-58cc-4372-a567-0e02b2c3d479
UKRes generate_v4(std::string &uuid);
UKRes generate_v4(SecureRandomSource &random, std::string &uuid);

// eg: 018bcfe5-6800-7xxx-yxxx-xxxxxxxxxxxx
UKRes generate_v7(std::string &uuid);
UKRes generate_v7(SecureRandomSource &random, MillisClock &clock,
                  std::string &uuid);

// Caller provided creation time. Only the low 48 bits of timestamp_ms are
// kept.
UKRes generate_v7_from_timestamp(uint64_t timestamp_ms, std::string &uuid);
UKRes generate_v7_from_timestamp(uint64_t timestamp_ms,
                                 SecureRandomSource &random,
                                 std::string &uuid);

// Binary variants, for callers that store the 16 bytes
UKRes generate_v4_layout(SecureRandomSource &random, UuidLayout &layout);
UKRes generate_v7_layout(uint64_t timestamp_ms, SecureRandomSource &random,
                         UuidLayout &layout);

} // namespace uuidkit
