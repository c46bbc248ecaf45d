// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "loader.hpp"
#include "rule_table.hpp"
#include "utils.hpp"

using namespace injhook;
using namespace std::literals;

namespace {

constexpr std::string_view rules = R"yaml(
sql:
  tokens: ["'\"\"'\"\n", "\"1\" OR '1'=\"1\""]
  matches: ["'\"\"'\"", "1\" OR '1'=\"1"]
  functions:
    sqlite3_exec: { param: 1 }
cmd:
  tokens: ["'\"FUZZ\"'", "$(FUZZ)"]
  matches: ["'\"FUZZ\"'"]
  functions:
    system: { param: 0 }
)yaml";

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *bytes, size_t size)
{
    static const rule_table table = load(rules);

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    std::string_view value{reinterpret_cast<const char *>(bytes), size};

    auto lower = to_lower(value);
    for (const auto &group : table.groups()) {
        bool expected = false;
        for (const auto &pattern : group.matches()) {
            if (lower.find(to_lower(pattern)) != std::string::npos) {
                expected = true;
                break;
            }
        }

        if (table.matches(group.name(), value) != expected) {
            __builtin_trap();
        }
    }

    return 0;
}
