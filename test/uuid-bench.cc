// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <benchmark/benchmark.h>

#include "hex_formatter.hpp"
#include "uuid.hpp"

#include <string>

namespace uuidkit {

static void BM_generate_v4(benchmark::State &state) {
  std::string uuid;
  for (auto _ : state) {
    benchmark::DoNotOptimize(generate_v4(uuid));
  }
}

BENCHMARK(BM_generate_v4);

static void BM_generate_v7(benchmark::State &state) {
  std::string uuid;
  for (auto _ : state) {
    benchmark::DoNotOptimize(generate_v7(uuid));
  }
}

BENCHMARK(BM_generate_v7);

static void BM_format(benchmark::State &state) {
  UuidLayout layout;
  layout.bytes.fill(0xA5);
  std::string text;
  for (auto _ : state) {
    benchmark::DoNotOptimize(format(layout, text));
  }
}

BENCHMARK(BM_format);
} // namespace uuidkit

BENCHMARK_MAIN();
