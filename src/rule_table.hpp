// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "function_ref.hpp"
#include "rule_group.hpp"

namespace injhook {

// Function / parameter pair to intercept at runtime
struct hook {
    function_ref function;
    unsigned param_index{0};
    std::string group;
    std::size_t group_index{0};

    bool operator==(const hook &other) const = default;
};

// Objective raised when an intercepted argument contains a match string
struct injection_event {
    std::string group;
    function_ref function;
    unsigned param_index{0};
    std::string highlight;

    bool operator==(const injection_event &other) const = default;
};

// Immutable table of rule groups. Once built, every accessor is const and
// free of shared mutable state, so a single instance can be consulted
// concurrently from any number of instrumented threads.
class rule_table {
public:
    rule_table() = default;
    explicit rule_table(std::vector<rule_group> groups);
    ~rule_table() = default;
    rule_table(const rule_table &) = default;
    rule_table(rule_table &&) noexcept = default;
    rule_table &operator=(const rule_table &) = default;
    rule_table &operator=(rule_table &&) noexcept = default;

    [[nodiscard]] const std::vector<rule_group> &groups() const { return groups_; }
    [[nodiscard]] std::size_t size() const { return groups_.size(); }
    [[nodiscard]] bool empty() const { return groups_.empty(); }

    [[nodiscard]] const rule_group *find_group(std::string_view name) const;
    [[nodiscard]] std::optional<std::size_t> group_index(std::string_view name) const;

    [[nodiscard]] std::span<const std::string> tokens_for(std::string_view group) const;
    // Union of every group's tokens, duplicates removed, in declaration order
    [[nodiscard]] std::vector<std::string> all_tokens() const;

    [[nodiscard]] const std::vector<hook> &hooks() const { return hooks_; }
    [[nodiscard]] std::vector<std::reference_wrapper<const hook>> hooks_for(
        const function_ref &function) const;

    [[nodiscard]] bool matches(std::string_view group, std::string_view value) const noexcept;
    [[nodiscard]] bool matches(std::size_t group_index, std::string_view value) const noexcept;

    [[nodiscard]] std::optional<injection_event> evaluate(
        const hook &target, std::string_view value) const;

protected:
    std::vector<rule_group> groups_;
    std::map<std::string, std::size_t, std::less<>> index_;
    std::vector<hook> hooks_;
    std::unordered_map<function_ref, std::vector<std::size_t>, function_ref_hash> hooks_by_function_;
};

} // namespace injhook
