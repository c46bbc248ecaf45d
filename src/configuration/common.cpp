// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "configuration/common.hpp"
#include "exception.hpp"
#include "utils.hpp"

namespace injhook {

std::string_view node_type_name(const YAML::Node &node)
{
    switch (node.Type()) {
    case YAML::NodeType::Scalar:
        return "scalar";
    case YAML::NodeType::Sequence:
        return "sequence";
    case YAML::NodeType::Map:
        return "map";
    case YAML::NodeType::Null:
        return "null";
    case YAML::NodeType::Undefined:
        break;
    }
    return "undefined";
}

namespace {

// Type a plain (unquoted) scalar resolves to under the YAML core schema
std::string_view plain_scalar_type(const YAML::Node &node)
{
    uint64_t unsigned_value{0};
    int64_t signed_value{0};
    if (YAML::convert<uint64_t>::decode(node, unsigned_value) ||
        YAML::convert<int64_t>::decode(node, signed_value)) {
        return "integer";
    }

    double float_value{0};
    if (YAML::convert<double>::decode(node, float_value)) {
        return "float";
    }

    // The yes / no variants of boolean are kept as strings
    const auto &value = node.Scalar();
    bool bool_value{false};
    if (!value.empty() && value[0] != 'Y' && value[0] != 'y' && value[0] != 'n' &&
        value[0] != 'N' && YAML::convert<bool>::decode(node, bool_value)) {
        return "boolean";
    }

    return "string";
}

} // namespace

template <> std::string convert_node<std::string>(const YAML::Node &node)
{
    if (!node.IsScalar()) {
        throw bad_cast("string", node_type_name(node));
    }

    if (node.Tag() == "?") {
        auto type = plain_scalar_type(node);
        if (type != "string") {
            throw bad_cast("string", type);
        }
    }

    return node.Scalar();
}

template <> int64_t convert_node<int64_t>(const YAML::Node &node)
{
    // Quoted scalars are strings, even when they look like a number
    if (!node.IsScalar() || node.Tag() == "!") {
        throw bad_cast("integer", node.IsScalar() ? "string" : node_type_name(node));
    }

    auto [res, value] = from_string<int64_t>(node.Scalar());
    if (!res) {
        throw bad_cast("integer", "string");
    }
    return value;
}

template <> std::vector<std::string> convert_node<std::vector<std::string>>(const YAML::Node &node)
{
    if (!node.IsSequence()) {
        throw bad_cast("sequence", node_type_name(node));
    }

    std::vector<std::string> items;
    items.reserve(node.size());
    for (const auto &item : node) { items.emplace_back(convert_node<std::string>(item)); }
    return items;
}

void expect_keys(const YAML::Node &map, std::initializer_list<std::string_view> keys)
{
    for (auto it = map.begin(); it != map.end(); ++it) {
        auto key = it->first.Scalar();
        if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
            throw unknown_key(key);
        }
    }
}

} // namespace injhook
