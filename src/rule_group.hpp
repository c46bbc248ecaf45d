// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "function_ref.hpp"
#include "matcher/substring_match.hpp"

namespace injhook {

struct function_entry {
    function_ref function;
    unsigned param_index{0};

    bool operator==(const function_entry &other) const = default;
};

// One vulnerability class: the tokens to inject, the substrings revealing a
// successful injection and the functions whose arguments act as sinks.
class rule_group {
public:
    rule_group(std::string name, std::vector<std::string> tokens, std::vector<std::string> matches,
        std::vector<function_entry> functions);
    ~rule_group() = default;
    rule_group(const rule_group &) = default;
    rule_group(rule_group &&) noexcept = default;
    rule_group &operator=(const rule_group &) = default;
    rule_group &operator=(rule_group &&) noexcept = default;

    [[nodiscard]] const std::string &name() const { return name_; }
    [[nodiscard]] const std::vector<std::string> &tokens() const { return tokens_; }
    [[nodiscard]] const std::vector<std::string> &matches() const { return matcher_.patterns(); }
    [[nodiscard]] const std::vector<function_entry> &functions() const { return functions_; }

    [[nodiscard]] std::pair<bool, std::string_view> match(std::string_view value) const noexcept
    {
        return matcher_.match(value);
    }

protected:
    std::string name_;
    std::vector<std::string> tokens_;
    matcher::substring_match matcher_;
    std::vector<function_entry> functions_;
};

} // namespace injhook
