// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "common/utils.hpp"
#include "configuration/parser_config.hpp"
#include "dictionary.hpp"
#include "exception.hpp"
#include "injhook.h"
#include "load_info.hpp"
#include "loader.hpp"
#include "rule_table.hpp"
#include "serializer.hpp"
#include "utils.hpp"

namespace {

constexpr int exit_objective = 1;
constexpr int exit_load_error = 2;

void usage(const char *name)
{
    std::cout << "Usage: " << name << " --rules <yaml/json file> [--arch <architecture>]"
              << " [--max-param <index>] [--dict <output file>] [--print]"
              << " [--check <group> [--] <value> [<value>..]] [--verbose]\n";
}

void print_diagnostics(const injhook::load_info &info)
{
    if (!info.error().empty()) {
        std::cerr << "error: " << info.error() << '\n';
    }

    for (const auto &[error, ids] : info.errors()) {
        for (const auto &id : ids) { std::cerr << id << " : " << error << '\n'; }
    }
}

void print_table(const injhook::rule_table &table)
{
    fmt::print("{} groups, {} hooks\n", table.size(), table.hooks().size());
    for (const auto &group : table.groups()) {
        fmt::print("  [{}] {} tokens, {} matches, {} functions\n", group.name(),
            group.tokens().size(), group.matches().size(), group.functions().size());
    }

    for (const auto &target : table.hooks()) {
        fmt::print("  hook {} param {} -> {}\n", target.function, target.param_index, target.group);
    }
}

} // namespace

int main(int argc, char *argv[])
{
    auto args = parse_args(argc, argv);

    if (args.contains("--verbose")) {
        injhook_set_log_cb(log_cb, INJHOOK_LOG_TRACE);
    } else if (args.contains("--log-level") && !args["--log-level"].empty()) {
        injhook_set_log_cb(log_cb, str_to_level(args["--log-level"].front()));
    } else {
        injhook_set_log_cb(log_cb, INJHOOK_LOG_OFF);
    }

    const std::vector<std::string> rules = args["--rules"];
    if (rules.size() != 1) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    injhook::parser_config config;
    if (args.contains("--arch") && !args["--arch"].empty()) {
        config.max_param_index = injhook::max_param_index_for(args["--arch"].front());
    }

    if (args.contains("--max-param") && !args["--max-param"].empty()) {
        auto [res, value] = injhook::from_string<unsigned>(args["--max-param"].front());
        if (!res) {
            std::cerr << "Invalid parameter index: " << args["--max-param"].front() << '\n';
            return EXIT_FAILURE;
        }
        config.max_param_index = value;
    }

    injhook::load_info info;
    injhook::rule_table table;
    try {
        table = injhook::load_file(rules.front(), config, info);
    } catch (const injhook::parsing_error &e) {
        std::cerr << "Failed to load " << rules.front() << ": " << e.what() << '\n';
        print_diagnostics(info);
        return exit_load_error;
    } catch (const std::system_error &e) {
        std::cerr << "Failed to read " << rules.front() << ": " << e.what() << '\n';
        return exit_load_error;
    }

    print_table(table);

    if (args.contains("--print")) {
        std::cout << injhook::serialize(table) << '\n';
    }

    if (args.contains("--dict")) {
        const auto &paths = args["--dict"];
        if (paths.empty()) {
            std::cout << injhook::to_dictionary(table);
        } else {
            try {
                injhook::write_dictionary(table, paths.front());
            } catch (const std::exception &e) {
                std::cerr << "Failed to write dictionary: " << e.what() << '\n';
                return EXIT_FAILURE;
            }
        }
    }

    int retval = EXIT_SUCCESS;
    if (args.contains("--check")) {
        const auto &check = args["--check"];
        if (check.empty()) {
            usage(argv[0]);
            return EXIT_FAILURE;
        }

        const auto &group = check.front();
        if (table.find_group(group) == nullptr) {
            std::cerr << "Unknown group: " << group << '\n';
            return EXIT_FAILURE;
        }

        for (std::size_t i = 1; i < check.size(); ++i) {
            bool match = table.matches(group, check[i]);
            fmt::print("{} : {} : {}\n", group, check[i], match ? "injection" : "clean");
            if (match) {
                retval = exit_objective;
            }
        }
    }

    return retval;
}
