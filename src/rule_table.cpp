// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "exception.hpp"
#include "log.hpp"
#include "rule_table.hpp"

namespace injhook {

rule_table::rule_table(std::vector<rule_group> groups) : groups_(std::move(groups))
{
    for (std::size_t i = 0; i < groups_.size(); ++i) {
        const auto &group = groups_[i];
        auto [it, res] = index_.emplace(group.name(), i);
        if (!res) {
            throw parsing_error("duplicate group '" + group.name() + "'");
        }

        for (const auto &entry : group.functions()) {
            hooks_by_function_[entry.function].emplace_back(hooks_.size());
            hooks_.emplace_back(hook{entry.function, entry.param_index, group.name(), i});
        }
    }

    INJHOOK_DEBUG("Rule table built with {} groups and {} hooks", groups_.size(), hooks_.size());
}

const rule_group *rule_table::find_group(std::string_view name) const
{
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &groups_[it->second];
}

std::optional<std::size_t> rule_table::group_index(std::string_view name) const
{
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::span<const std::string> rule_table::tokens_for(std::string_view group) const
{
    const auto *ptr = find_group(group);
    if (ptr == nullptr) {
        return {};
    }
    return ptr->tokens();
}

std::vector<std::string> rule_table::all_tokens() const
{
    std::vector<std::string> tokens;
    std::unordered_set<std::string_view> seen;
    for (const auto &group : groups_) {
        for (const auto &token : group.tokens()) {
            if (seen.emplace(token).second) {
                tokens.emplace_back(token);
            }
        }
    }
    return tokens;
}

std::vector<std::reference_wrapper<const hook>> rule_table::hooks_for(
    const function_ref &function) const
{
    std::vector<std::reference_wrapper<const hook>> result;
    auto it = hooks_by_function_.find(function);
    if (it != hooks_by_function_.end()) {
        result.reserve(it->second.size());
        for (auto idx : it->second) { result.emplace_back(hooks_[idx]); }
    }
    return result;
}

bool rule_table::matches(std::string_view group, std::string_view value) const noexcept
{
    const auto *ptr = find_group(group);
    return ptr != nullptr && ptr->match(value).first;
}

bool rule_table::matches(std::size_t group_index, std::string_view value) const noexcept
{
    return group_index < groups_.size() && groups_[group_index].match(value).first;
}

std::optional<injection_event> rule_table::evaluate(const hook &target, std::string_view value) const
{
    if (target.group_index >= groups_.size()) {
        return std::nullopt;
    }

    auto [res, highlight] = groups_[target.group_index].match(value);
    if (!res) {
        return std::nullopt;
    }

    INJHOOK_DEBUG("Injection detected in {} parameter {} for group {}", target.function,
        target.param_index, target.group);

    return injection_event{
        target.group, target.function, target.param_index, std::string{highlight}};
}

} // namespace injhook
