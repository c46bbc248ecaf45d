// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <array>
#include <string_view>
#include <utility>

#include "configuration/parser_config.hpp"
#include "utils.hpp"

using namespace std::literals;

namespace injhook {

namespace {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
constexpr std::array<std::pair<std::string_view, unsigned>, 9> architecture_bounds{{
    {"x86_64"sv, 5},
    {"amd64"sv, 5},
    {"i386"sv, 5},
    {"x86"sv, 5},
    {"aarch64"sv, 7},
    {"arm64"sv, 7},
    {"arm"sv, 3},
    {"mips"sv, 3},
    {"ppc"sv, 7},
}};
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

} // namespace

unsigned max_param_index_for(std::string_view architecture)
{
    for (const auto &[name, bound] : architecture_bounds) {
        if (string_iequals(name, architecture)) {
            return bound;
        }
    }
    return parser_config::default_max_param_index;
}

} // namespace injhook
