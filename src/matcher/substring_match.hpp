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

namespace injhook::matcher {

// Literal, case-insensitive, multi-pattern substring matcher. Patterns are
// folded to lowercase on construction so that matching never allocates and
// never touches mutable state.
class substring_match {
public:
    static constexpr std::string_view matcher_name = "substring_match";

    explicit substring_match(std::vector<std::string> patterns);
    ~substring_match() = default;
    substring_match(const substring_match &) = default;
    substring_match(substring_match &&) noexcept = default;
    substring_match &operator=(const substring_match &) = default;
    substring_match &operator=(substring_match &&) noexcept = default;

    [[nodiscard]] std::string_view name() const { return matcher_name; }

    // Returns whether a pattern was found and the pattern, as originally
    // provided, which produced the first match.
    [[nodiscard]] std::pair<bool, std::string_view> match(std::string_view value) const noexcept;

    [[nodiscard]] const std::vector<std::string> &patterns() const { return patterns_; }
    [[nodiscard]] bool empty() const { return patterns_.empty(); }

protected:
    std::vector<std::string> patterns_;
    std::vector<std::string> lower_patterns_;
};

} // namespace injhook::matcher
