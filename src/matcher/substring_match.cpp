// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "matcher/substring_match.hpp"
#include "utils.hpp"

namespace injhook::matcher {

substring_match::substring_match(std::vector<std::string> patterns) : patterns_(std::move(patterns))
{
    lower_patterns_.reserve(patterns_.size());
    for (const auto &pattern : patterns_) {
        if (pattern.empty()) {
            throw std::invalid_argument("empty pattern");
        }
        lower_patterns_.emplace_back(to_lower(pattern));
    }
}

std::pair<bool, std::string_view> substring_match::match(std::string_view value) const noexcept
{
    if (value.empty() || value.data() == nullptr) {
        return {false, {}};
    }

    for (std::size_t i = 0; i < lower_patterns_.size(); ++i) {
        if (ifind(value, lower_patterns_[i]) != std::string_view::npos) {
            return {true, patterns_[i]};
        }
    }

    return {false, {}};
}

} // namespace injhook::matcher
