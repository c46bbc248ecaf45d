// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "injhook.h"

const char *level_to_str(INJHOOK_LOG_LEVEL level);
INJHOOK_LOG_LEVEL str_to_level(std::string_view str);

void log_cb(INJHOOK_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);

// Maps each recognised option, normalised to its long form, to its values
// NOLINTNEXTLINE(modernize-avoid-c-arrays)
std::unordered_map<std::string, std::vector<std::string>> parse_args(int argc, char *argv[]);
