// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>

#include "exception.hpp"
#include "function_ref.hpp"
#include "utils.hpp"

namespace injhook {

namespace {

constexpr std::size_t max_address_digits = 16;

address parse_address(std::string_view identifier)
{
    auto digits = identifier.substr(2);
    if (digits.empty()) {
        throw parsing_error("invalid address '" + std::string{identifier} + "': no digits");
    }

    // Leading zeros don't count towards the width of the address
    auto significant = digits.substr(std::min(digits.find_first_not_of('0'), digits.size()));
    if (significant.size() > max_address_digits) {
        throw parsing_error("invalid address '" + std::string{identifier} + "': out of range");
    }

    uint64_t value = 0;
    for (auto c : digits) {
        if (!isxdigit(c)) {
            throw parsing_error(
                "invalid address '" + std::string{identifier} + "': non-hexadecimal digit");
        }
        value = (value << 4U) | from_hex(c);
    }

    return {value};
}

} // namespace

function_ref parse_function_ref(std::string_view identifier)
{
    if (identifier.empty()) {
        throw parsing_error("empty function identifier");
    }

    if (identifier.size() >= 2 && identifier[0] == '0' &&
        (identifier[1] == 'x' || identifier[1] == 'X')) {
        return parse_address(identifier);
    }

    if (isdigit(identifier[0])) {
        throw parsing_error("numeric function identifier '" + std::string{identifier} +
                            "' must be prefixed with 0x");
    }

    return symbol{std::string{identifier}};
}

std::string to_string(const function_ref &ref)
{
    if (const auto *addr = std::get_if<address>(&ref); addr != nullptr) {
        return fmt::format("{:#x}", addr->value);
    }
    return std::get<symbol>(ref).name;
}

std::size_t function_ref_hash::operator()(const function_ref &ref) const noexcept
{
    if (const auto *addr = std::get_if<address>(&ref); addr != nullptr) {
        return std::hash<uint64_t>{}(addr->value);
    }
    return std::hash<std::string>{}(std::get<symbol>(ref).name);
}

} // namespace injhook
