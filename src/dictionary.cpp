// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cerrno>
#include <cstddef>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "dictionary.hpp"
#include "log.hpp"
#include "rule_table.hpp"
#include "utils.hpp"

namespace injhook {

std::string escape_dictionary_token(std::string_view token)
{
    std::string escaped;
    escaped.reserve(token.size());
    for (auto c : token) {
        if (c == '\\' || c == '"') {
            escaped += '\\';
            escaped += c;
        } else if (isprint(c)) {
            escaped += c;
        } else {
            escaped += fmt::format("\\x{:02X}", static_cast<unsigned char>(c));
        }
    }
    return escaped;
}

namespace {

// Dictionary keywords only accept alphanumeric characters and underscores
std::string keyword_prefix(std::string_view name)
{
    std::string prefix{name};
    for (auto &c : prefix) {
        if (!isalpha(c) && !isdigit(c)) {
            c = '_';
        }
    }
    return prefix;
}

} // namespace

std::string to_dictionary(const rule_table &table)
{
    std::string dict;
    for (const auto &group : table.groups()) {
        const auto prefix = keyword_prefix(group.name());
        const auto &tokens = group.tokens();
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            dict += fmt::format("{}_{}=\"{}\"\n", prefix, i, escape_dictionary_token(tokens[i]));
        }
    }
    return dict;
}

void write_dictionary(const rule_table &table, std::string_view path)
{
    std::ofstream file(std::string{path}, std::ios::out | std::ios::trunc);
    if (!file) {
        throw std::system_error(errno, std::generic_category(), std::string{path});
    }

    file << to_dictionary(table);
    if (!file) {
        throw std::system_error(errno, std::generic_category(), std::string{path});
    }

    INJHOOK_INFO("Dictionary written to {}", path);
}

} // namespace injhook
