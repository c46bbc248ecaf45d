// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <vector>

#include <yaml-cpp/emitter.h>
#include <yaml-cpp/emittermanip.h>

#include "exception.hpp"
#include "function_ref.hpp"
#include "rule_table.hpp"
#include "serializer.hpp"

namespace injhook {

namespace {

void emit_strings(YAML::Emitter &out, const char *key, const std::vector<std::string> &strings)
{
    out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto &str : strings) { out << YAML::DoubleQuoted << str; }
    out << YAML::EndSeq;
}

} // namespace

std::string serialize(const rule_table &table)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto &group : table.groups()) {
        out << YAML::Key << YAML::DoubleQuoted << group.name() << YAML::Value << YAML::BeginMap;

        emit_strings(out, "tokens", group.tokens());
        emit_strings(out, "matches", group.matches());

        out << YAML::Key << "functions" << YAML::Value << YAML::BeginMap;
        for (const auto &entry : group.functions()) {
            out << YAML::Key << YAML::DoubleQuoted << to_string(entry.function) << YAML::Value
                << YAML::Flow << YAML::BeginMap << YAML::Key << "param" << YAML::Value
                << entry.param_index << YAML::EndMap;
        }
        out << YAML::EndMap;

        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    if (!out.good()) {
        throw exception("failed to serialize rule table: " + out.GetLastError());
    }

    return out.c_str();
}

} // namespace injhook
