// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "exception.hpp"
#include "function_ref.hpp"
#include "rule_group.hpp"

namespace injhook {

namespace {

matcher::substring_match make_matcher(const std::string &group, std::vector<std::string> matches)
{
    for (const auto &pattern : matches) {
        if (pattern.empty()) {
            throw parsing_error("group '" + group + "' contains an empty match string");
        }
    }
    return matcher::substring_match{std::move(matches)};
}

} // namespace

rule_group::rule_group(std::string name, std::vector<std::string> tokens,
    std::vector<std::string> matches, std::vector<function_entry> functions)
    : name_(std::move(name)), tokens_(std::move(tokens)),
      matcher_(make_matcher(name_, std::move(matches))), functions_(std::move(functions))
{
    if (name_.empty()) {
        throw parsing_error("empty group name");
    }

    std::unordered_set<function_ref, function_ref_hash> seen;
    for (const auto &entry : functions_) {
        if (!seen.emplace(entry.function).second) {
            throw parsing_error(
                "function '" + to_string(entry.function) + "' hooked twice in group '" + name_ + "'");
        }
    }
}

} // namespace injhook
