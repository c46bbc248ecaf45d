// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>

#include "rule_table.hpp"

namespace injhook {

// Emits the table in the same YAML layout accepted by the loader
std::string serialize(const rule_table &table);

} // namespace injhook
