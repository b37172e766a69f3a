// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "ukres_def.hpp"
#include "ukres_exception.hpp"
#include "ukres_helpers.hpp"
#include "ukres_list.hpp"
