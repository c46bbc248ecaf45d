// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/format.h>

namespace injhook {

// Function identified by its symbol name, resolved by the instrumentation layer
struct symbol {
    std::string name;

    bool operator==(const symbol &other) const = default;
};

// Absolute address of a function lacking a symbol (stripped or JIT code)
struct address {
    uint64_t value{0};

    bool operator==(const address &other) const = default;
};

using function_ref = std::variant<symbol, address>;

// Identifiers starting with 0x / 0X are addresses, any other identifier
// starting with a digit is rejected, everything else is a symbol name.
// Throws parsing_error on invalid identifiers.
function_ref parse_function_ref(std::string_view identifier);

inline bool is_address(const function_ref &ref) { return std::holds_alternative<address>(ref); }

std::string to_string(const function_ref &ref);

struct function_ref_hash {
    std::size_t operator()(const function_ref &ref) const noexcept;
};

} // namespace injhook

template <> struct fmt::formatter<injhook::function_ref> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const injhook::function_ref &ref, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(injhook::to_string(ref), ctx);
    }
};
