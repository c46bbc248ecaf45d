// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "utils.hpp"

namespace injhook {

std::string to_lower(std::string_view str)
{
    std::string lower;
    lower.resize(str.size());
    std::transform(str.begin(), str.end(), lower.begin(), [](char c) { return tolower(c); });
    return lower;
}

bool string_iequals(std::string_view left, std::string_view right)
{
    return left.size() == right.size() &&
           std::equal(left.begin(), left.end(), right.begin(),
               [](char l, char r) { return tolower(l) == tolower(r); });
}

std::size_t ifind(std::string_view haystack, std::string_view lower_needle) noexcept
{
    if (lower_needle.size() > haystack.size()) {
        return std::string_view::npos;
    }

    auto it = std::search(haystack.begin(), haystack.end(), lower_needle.begin(),
        lower_needle.end(), [](char h, char n) { return tolower(h) == n; });
    if (it == haystack.end() && !lower_needle.empty()) {
        return std::string_view::npos;
    }

    return static_cast<std::size_t>(it - haystack.begin());
}

template <typename T> std::string to_string(T value) { return fmt::format("{}", value); }

template <typename T> std::pair<bool, T> from_string(std::string_view str)
{
    T result;
    const auto *end = str.data() + str.size();
    auto [endConv, err] = std::from_chars(str.data(), end, result);
    if (err == std::errc{} && endConv == end) {
        return {true, result};
    }

    return {false, {}};
}

template std::string to_string<int64_t>(int64_t value);
template std::string to_string<uint64_t>(uint64_t value);
template std::string to_string<unsigned>(unsigned value);

template std::pair<bool, unsigned> from_string<unsigned>(std::string_view str);
template std::pair<bool, int64_t> from_string<int64_t>(std::string_view str);
template std::pair<bool, uint64_t> from_string<uint64_t>(std::string_view str);

} // namespace injhook
