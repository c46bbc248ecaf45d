// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "common/utils.hpp"
#include "injhook.h"

using namespace std::literals;

const char *level_to_str(INJHOOK_LOG_LEVEL level)
{
    switch (level) {
    case INJHOOK_LOG_TRACE:
        return "trace";
    case INJHOOK_LOG_DEBUG:
        return "debug";
    case INJHOOK_LOG_ERROR:
        return "error";
    case INJHOOK_LOG_WARN:
        return "warn";
    case INJHOOK_LOG_INFO:
        return "info";
    case INJHOOK_LOG_OFF:
        break;
    }

    return "off";
}

INJHOOK_LOG_LEVEL str_to_level(std::string_view str)
{
    if (str == "trace"sv || str == "TRACE"sv) {
        return INJHOOK_LOG_TRACE;
    }

    if (str == "debug"sv || str == "DEBUG"sv) {
        return INJHOOK_LOG_DEBUG;
    }

    if (str == "error"sv || str == "ERROR"sv) {
        return INJHOOK_LOG_ERROR;
    }

    if (str == "warn"sv || str == "WARN"sv) {
        return INJHOOK_LOG_WARN;
    }

    if (str == "info"sv || str == "INFO"sv) {
        return INJHOOK_LOG_INFO;
    }

    return INJHOOK_LOG_OFF;
}

void log_cb(INJHOOK_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    std::cerr << "[" << level_to_str(level) << "][" << file << ":" << function << ":" << line
              << "]: " << message << '\n';
}

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
std::unordered_map<std::string, std::vector<std::string>> parse_args(int argc, char *argv[])
{
    const std::map<std::string, std::string, std::less<>> arg_mapping{{"-r", "--rules"},
        {"--rules", "--rules"}, {"-a", "--arch"}, {"--arch", "--arch"}, {"-m", "--max-param"},
        {"--max-param", "--max-param"}, {"-d", "--dict"}, {"--dict", "--dict"},
        {"-c", "--check"}, {"--check", "--check"}, {"-p", "--print"}, {"--print", "--print"},
        {"-l", "--log-level"}, {"--log-level", "--log-level"}, {"-v", "--verbose"},
        {"--verbose", "--verbose"}};

    std::unordered_map<std::string, std::vector<std::string>> args;
    auto last_arg = args.end();
    bool verbatim = false;
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (!verbatim && arg == "--") {
            // Everything after the separator is a value of the last option
            verbatim = true;
            continue;
        }

        if (!verbatim && arg.starts_with('-') && arg.size() > 1) {
            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                auto [it, res] = args.emplace(long_arg->second, std::vector<std::string>{});
                last_arg = it;
                continue;
            }

            // Checked values are arbitrary, e.g. "-1' OR 1=1"
            if (last_arg == args.end() || last_arg->first != "--check") {
                std::cerr << "Ignoring unknown option " << arg << '\n';
                last_arg = args.end();
                continue;
            }
        }

        if (last_arg != args.end()) {
            last_arg->second.emplace_back(arg);
        }
    }
    return args;
}
