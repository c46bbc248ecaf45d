// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "exception.hpp"

namespace injhook {

std::string_view node_type_name(const YAML::Node &node);

// Conversions from a YAML node, throwing bad_cast on a type mismatch
template <typename T> T convert_node(const YAML::Node &node);

template <> std::string convert_node<std::string>(const YAML::Node &node);
template <> int64_t convert_node<int64_t>(const YAML::Node &node);
template <> std::vector<std::string> convert_node<std::vector<std::string>>(const YAML::Node &node);

template <typename T> T at(const YAML::Node &map, std::string_view key)
{
    auto node = map[std::string{key}];
    if (!node.IsDefined()) {
        throw missing_key(std::string(key));
    }

    try {
        return convert_node<T>(node);
    } catch (const bad_cast &e) {
        throw invalid_type(std::string(key), e);
    }
}

template <typename T> T at(const YAML::Node &map, std::string_view key, const T &default_)
{
    auto node = map[std::string{key}];
    if (!node.IsDefined()) {
        return default_;
    }

    try {
        return convert_node<T>(node);
    } catch (const bad_cast &e) {
        throw invalid_type(std::string(key), e);
    }
}

// Throws unknown_key if the map contains a key outside of the expected set
void expect_keys(const YAML::Node &map, std::initializer_list<std::string_view> keys);

} // namespace injhook
