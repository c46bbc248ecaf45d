// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>

namespace injhook {

struct parser_config {
    static constexpr unsigned default_max_param_index = 5;

    // Highest accepted parameter index, inclusive
    unsigned max_param_index{default_max_param_index};
};

// Highest argument index passed in registers on the given architecture, or the
// default bound for an unknown architecture.
unsigned max_param_index_for(std::string_view architecture);

} // namespace injhook
