// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cerrno>
#include <fstream>
#include <ios>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

#include <yaml-cpp/yaml.h>

#include "configuration/parser_config.hpp"
#include "configuration/rule_parser.hpp"
#include "exception.hpp"
#include "load_info.hpp"
#include "loader.hpp"
#include "log.hpp"
#include "rule_table.hpp"

namespace injhook {

rule_table load(std::string_view source, const parser_config &config, load_info &info)
{
    YAML::Node root;
    try {
        root = YAML::Load(std::string{source});
    } catch (const YAML::Exception &e) {
        info.set_error(e.what());
        INJHOOK_ERROR("Malformed rule source: {}", e.what());
        throw parsing_error(std::string{"malformed rule source: "} + e.what());
    }

    return parse_rule_table(root, config, info);
}

rule_table load(std::string_view source, const parser_config &config)
{
    load_info info;
    return load(source, config, info);
}

rule_table load_file(std::string_view path, const parser_config &config, load_info &info)
{
    INJHOOK_DEBUG("Loading rules from {}", path);
    return load(read_file(path), config, info);
}

rule_table load_file(std::string_view path, const parser_config &config)
{
    load_info info;
    return load_file(path, config, info);
}

std::string read_file(std::string_view path)
{
    std::ifstream file(std::string{path}, std::ios::in | std::ios::binary);
    if (!file) {
        throw std::system_error(errno, std::generic_category(), std::string{path});
    }

    // Create a buffer equal to the file size
    std::string buffer;
    file.ignore(std::numeric_limits<std::streamsize>::max());
    std::streamsize length = file.gcount();
    file.clear();
    buffer.resize(length, '\0');
    file.seekg(0, std::ios::beg);

    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    return buffer;
}

} // namespace injhook
