// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "configuration/parser_config.hpp"
#include "load_info.hpp"
#include "rule_table.hpp"

namespace injhook {

// Loads a YAML (or JSON) rule source, throws parsing_error on any error
rule_table load(std::string_view source, const parser_config &config, load_info &info);
rule_table load(std::string_view source, const parser_config &config = {});

// As above, additionally throws std::system_error if the file can't be read
rule_table load_file(std::string_view path, const parser_config &config, load_info &info);
rule_table load_file(std::string_view path, const parser_config &config = {});

std::string read_file(std::string_view path);

} // namespace injhook
