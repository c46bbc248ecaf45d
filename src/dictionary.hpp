// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "rule_table.hpp"

namespace injhook {

// AFL / libFuzzer dictionary with one `<group>_<n>="<token>"` entry per token
std::string to_dictionary(const rule_table &table);

void write_dictionary(const rule_table &table, std::string_view path);

std::string escape_dictionary_token(std::string_view token);

} // namespace injhook
