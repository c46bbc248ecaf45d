// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <yaml-cpp/yaml.h>

#include "configuration/parser_config.hpp"
#include "load_info.hpp"
#include "rule_table.hpp"

namespace injhook {

// Builds a rule table out of a map of group definitions:
//
//   <group>:
//     tokens: [<string>, ...]
//     matches: [<string>, ...]
//     functions:
//       <symbol or 0x address>: { param: <index> }
//
// Every invalid entry is recorded in the diagnostics, after which the first
// error is thrown as a parsing_error; no partial table is ever returned.
rule_table parse_rule_table(const YAML::Node &root, const parser_config &config, load_info &info);

} // namespace injhook
