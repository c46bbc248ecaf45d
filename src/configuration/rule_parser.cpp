// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "configuration/common.hpp"
#include "configuration/parser_config.hpp"
#include "configuration/rule_parser.hpp"
#include "exception.hpp"
#include "function_ref.hpp"
#include "load_info.hpp"
#include "log.hpp"
#include "rule_group.hpp"
#include "rule_table.hpp"
#include "utils.hpp"

namespace injhook {

namespace {

struct failure_tracker {
    load_info &info;
    std::optional<std::string> first{};

    void add(const std::string &id, std::string_view error)
    {
        INJHOOK_WARN("Failed to parse '{}': {}", id, error);
        info.add_failed(id, error);
        if (!first.has_value()) {
            first = id + ": " + std::string{error};
        }
    }
};

unsigned parse_param_index(const YAML::Node &node, const parser_config &config)
{
    if (!node.IsMap()) {
        throw invalid_type("param", bad_cast("map", node_type_name(node)));
    }

    expect_keys(node, {"param"});

    auto index = at<int64_t>(node, "param");
    if (index < 0 || static_cast<uint64_t>(index) > config.max_param_index) {
        throw parsing_error("parameter index " + to_string<int64_t>(index) +
                            " out of range [0, " + to_string<unsigned>(config.max_param_index) +
                            "]");
    }

    return static_cast<unsigned>(index);
}

std::optional<rule_group> parse_group(const std::string &name, const YAML::Node &node,
    const parser_config &config, failure_tracker &failures)
{
    if (!node.IsMap()) {
        throw bad_cast("map", node_type_name(node));
    }

    expect_keys(node, {"tokens", "matches", "functions"});

    auto tokens = at<std::vector<std::string>>(node, "tokens", {});
    auto matches = at<std::vector<std::string>>(node, "matches", {});

    std::vector<function_entry> functions;
    bool functions_valid = true;

    auto functions_node = node["functions"];
    if (functions_node.IsDefined()) {
        if (!functions_node.IsMap()) {
            throw invalid_type("functions", bad_cast("map", node_type_name(functions_node)));
        }

        std::unordered_set<std::string> seen;
        for (auto it = functions_node.begin(); it != functions_node.end(); ++it) {
            const auto identifier = it->first.Scalar();
            const auto id = name + ".functions." + identifier;
            try {
                if (!seen.emplace(identifier).second) {
                    throw parsing_error("duplicate function");
                }

                auto function = parse_function_ref(identifier);
                auto param_index = parse_param_index(it->second, config);

                INJHOOK_DEBUG("Parsed hook {} parameter {} in group {}", function, param_index,
                    name);
                functions.emplace_back(function_entry{std::move(function), param_index});
            } catch (const std::exception &e) {
                failures.add(id, e.what());
                functions_valid = false;
            }
        }
    }

    if (!functions_valid) {
        return std::nullopt;
    }

    return rule_group{name, std::move(tokens), std::move(matches), std::move(functions)};
}

} // namespace

rule_table parse_rule_table(const YAML::Node &root, const parser_config &config, load_info &info)
{
    if (!root.IsDefined() || root.IsNull()) {
        INJHOOK_DEBUG("Empty rule source");
        return {};
    }

    if (!root.IsMap()) {
        auto error = "invalid rule source, expected 'map' found '" +
                     std::string{node_type_name(root)} + "'";
        info.set_error(error);
        throw parsing_error(error);
    }

    failure_tracker failures{info};
    std::vector<rule_group> groups;
    std::unordered_set<std::string> names;

    unsigned index = 0;
    for (auto it = root.begin(); it != root.end(); ++it, ++index) {
        std::string name;
        try {
            name = convert_node<std::string>(it->first);
            if (name.empty()) {
                throw parsing_error("empty group name");
            }

            if (!names.emplace(name).second) {
                throw parsing_error("duplicate group");
            }

            auto group = parse_group(name, it->second, config, failures);
            if (!group.has_value()) {
                continue;
            }

            INJHOOK_DEBUG("Parsed group {} with {} tokens, {} matches and {} functions", name,
                group->tokens().size(), group->matches().size(), group->functions().size());
            info.add_loaded(name);
            groups.emplace_back(std::move(*group));
        } catch (const std::exception &e) {
            failures.add(name.empty() ? index_to_id(index) : name, e.what());
        }
    }

    if (failures.first.has_value()) {
        throw parsing_error(*failures.first);
    }

    return rule_table{std::move(groups)};
}

} // namespace injhook
