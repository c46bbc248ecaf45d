// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <atomic>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "common/gtest_utils.hpp"
#include "exception.hpp"
#include "loader.hpp"
#include "rule_group.hpp"
#include "rule_table.hpp"
#include "utils.hpp"

using namespace injhook;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

std::vector<std::string> to_vector(std::span<const std::string> tokens)
{
    return {tokens.begin(), tokens.end()};
}

rule_table make_table()
{
    std::vector<rule_group> groups;
    groups.emplace_back("sql", std::vector<std::string>{"'\"\"'\"\n", "\"1\" OR '1'=\"1\""},
        std::vector<std::string>{"'\"\"'\"", "1\" OR '1'=\"1"},
        std::vector<function_entry>{{symbol{"sqlite3_exec"}, 1}, {symbol{"PQexec"}, 1}});
    groups.emplace_back("cmd", std::vector<std::string>{"'\"FUZZ\"'", "$(FUZZ)"},
        std::vector<std::string>{"'\"FUZZ\"'"},
        std::vector<function_entry>{{symbol{"popen"}, 0}, {symbol{"system"}, 0}});
    groups.emplace_back("jit", std::vector<std::string>{"$(FUZZ)"}, std::vector<std::string>{},
        std::vector<function_entry>{{address{0x7f0000401000}, 2}, {symbol{"system"}, 0}});
    return rule_table{std::move(groups)};
}

TEST(TestRuleTable, EmptyTable)
{
    rule_table table;
    EXPECT_TRUE(table.empty());
    EXPECT_THAT(table.hooks(), IsEmpty());
    EXPECT_THAT(table.all_tokens(), IsEmpty());
    EXPECT_FALSE(table.matches("sql", "anything"));
    EXPECT_EQ(table.find_group("sql"), nullptr);
}

TEST(TestRuleTable, GroupLookup)
{
    auto table = make_table();

    ASSERT_EQ(table.size(), 3);
    EXPECT_EQ(table.group_index("sql"), 0);
    EXPECT_EQ(table.group_index("cmd"), 1);
    EXPECT_EQ(table.group_index("jit"), 2);
    EXPECT_FALSE(table.group_index("ldap").has_value());

    const auto *cmd = table.find_group("cmd");
    ASSERT_NE(cmd, nullptr);
    EXPECT_STR(cmd->name(), "cmd");
}

TEST(TestRuleTable, DuplicateGroupName)
{
    std::vector<rule_group> groups;
    groups.emplace_back("cmd", std::vector<std::string>{}, std::vector<std::string>{},
        std::vector<function_entry>{});
    groups.emplace_back("cmd", std::vector<std::string>{}, std::vector<std::string>{},
        std::vector<function_entry>{});
    EXPECT_THROW(rule_table{std::move(groups)}, parsing_error);
}

TEST(TestRuleTable, InvalidGroups)
{
    EXPECT_THROW(rule_group("", {}, {}, {}), parsing_error);
    EXPECT_THROW(rule_group("cmd", {}, {"a", ""}, {}), parsing_error);
    EXPECT_THROW(
        rule_group("cmd", {}, {}, {{symbol{"system"}, 0}, {symbol{"system"}, 1}}), parsing_error);
}

TEST(TestRuleTable, TokensFor)
{
    auto table = make_table();

    EXPECT_THAT(to_vector(table.tokens_for("cmd")), ElementsAre("'\"FUZZ\"'", "$(FUZZ)"));
    EXPECT_THAT(to_vector(table.tokens_for("sql")), ElementsAre("'\"\"'\"\n", "\"1\" OR '1'=\"1\""));
    EXPECT_THAT(table.tokens_for("unknown"), IsEmpty());
}

TEST(TestRuleTable, AllTokensDeduplicated)
{
    auto table = make_table();

    EXPECT_THAT(table.all_tokens(),
        ElementsAre("'\"\"'\"\n", "\"1\" OR '1'=\"1\"", "'\"FUZZ\"'", "$(FUZZ)"));
}

TEST(TestRuleTable, HooksInDeclarationOrder)
{
    auto table = make_table();

    EXPECT_THAT(table.hooks(), ElementsAre(hook{symbol{"sqlite3_exec"}, 1, "sql", 0},
                                   hook{symbol{"PQexec"}, 1, "sql", 0},
                                   hook{symbol{"popen"}, 0, "cmd", 1},
                                   hook{symbol{"system"}, 0, "cmd", 1},
                                   hook{address{0x7f0000401000}, 2, "jit", 2},
                                   hook{symbol{"system"}, 0, "jit", 2}));
}

TEST(TestRuleTable, HooksForFunction)
{
    auto table = make_table();

    auto system_hooks = table.hooks_for(symbol{"system"});
    ASSERT_EQ(system_hooks.size(), 2);
    EXPECT_STR(system_hooks[0].get().group, "cmd");
    EXPECT_STR(system_hooks[1].get().group, "jit");

    auto address_hooks = table.hooks_for(address{0x7f0000401000});
    ASSERT_EQ(address_hooks.size(), 1);
    EXPECT_EQ(address_hooks[0].get().param_index, 2);

    EXPECT_THAT(table.hooks_for(symbol{"execve"}), IsEmpty());
    // A symbol spelled like an address is a different function
    EXPECT_THAT(table.hooks_for(symbol{"0x7f0000401000"}), IsEmpty());
}

TEST(TestRuleTable, CommandHookScenario)
{
    auto table = load(R"yaml(
cmd:
  tokens: ["'\"FUZZ\"'"]
  matches: ["'\"FUZZ\"'"]
  functions:
    system: { param: 0 }
)yaml");

    EXPECT_THAT(table.hooks(), Contains(hook{symbol{"system"}, 0, "cmd", 0}));
}

TEST(TestRuleTable, SqlMatchScenario)
{
    auto table = make_table();

    EXPECT_TRUE(table.matches("sql", "SELECT * FROM t WHERE id = \"1\" OR '1'=\"1\""));
    EXPECT_TRUE(table.matches("sql", "select * from t where id = \"1\" or '1'=\"1\""));
    EXPECT_TRUE(table.matches("sql", "INSERT INTO t VALUES(''\"\"'\"\n')"));
    EXPECT_FALSE(table.matches("sql", "SELECT 1"));
    // Quotes are compared literally, a different quoting style is not a match
    EXPECT_FALSE(table.matches("sql", "SELECT * FROM t WHERE id = '1\" OR '1'='1"));
}

TEST(TestRuleTable, MatchIsLowercaseContainment)
{
    auto table = make_table();
    const auto *cmd = table.find_group("cmd");
    ASSERT_NE(cmd, nullptr);

    std::vector<std::string_view> values{"", "FUZZ", "'\"FUZZ\"'", "sh -c 'echo '\"fuzz\"''",
        "'\"fUzZ\"'", "' \"FUZZ\" '", "$(FUZZ)", "prefix'\"FUZZ\"'suffix", "'\"FUZ\"'"};

    for (auto value : values) {
        bool expected = false;
        for (const auto &pattern : cmd->matches()) {
            expected |= to_lower(value).find(to_lower(pattern)) != std::string::npos;
        }
        EXPECT_EQ(table.matches("cmd", value), expected) << value;
    }
}

TEST(TestRuleTable, MatchByIndex)
{
    auto table = make_table();

    EXPECT_FALSE(table.matches(1, "popen(\"'\\\"FUZZ\\\"'\")"));
    EXPECT_TRUE(table.matches(1, "echo '\"FUZZ\"'"));
    EXPECT_FALSE(table.matches(0, "echo '\"FUZZ\"'"));
    EXPECT_FALSE(table.matches(3, "echo '\"FUZZ\"'"));
}

TEST(TestRuleTable, EmptyMatchListNeverMatches)
{
    auto table = make_table();

    EXPECT_FALSE(table.matches("jit", "$(FUZZ)"));
    EXPECT_FALSE(table.matches("jit", ""));
}

TEST(TestRuleTable, UnknownGroupNeverMatches)
{
    auto table = make_table();
    EXPECT_FALSE(table.matches("ldap", "*)(FUZZ=*))(|"));
}

TEST(TestRuleTable, EvaluateHook)
{
    auto table = make_table();
    const auto &system_hook = table.hooks()[3];

    auto event = table.evaluate(system_hook, "sh -c 'ls '\"fuzz\"''");
    ASSERT_TRUE(event.has_value());
    EXPECT_STR(event->group, "cmd");
    EXPECT_EQ(event->function, function_ref{symbol{"system"}});
    EXPECT_EQ(event->param_index, 0);
    EXPECT_STR(event->highlight, "'\"FUZZ\"'");

    EXPECT_FALSE(table.evaluate(system_hook, "ls -la").has_value());

    hook dangling{symbol{"system"}, 0, "gone", 42};
    EXPECT_FALSE(table.evaluate(dangling, "'\"FUZZ\"'").has_value());
}

TEST(TestRuleTable, ConcurrentMatching)
{
    auto table = std::make_shared<const rule_table>(make_table());

    constexpr unsigned thread_count = 8;
    constexpr unsigned iterations = 2000;

    std::atomic<unsigned> matches{0};
    std::atomic<unsigned> mismatches{0};
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (unsigned t = 0; t < thread_count; ++t) {
        threads.emplace_back([table, &matches, &mismatches]() {
            for (unsigned i = 0; i < iterations; ++i) {
                if (table->matches("cmd", "bash -c 'id; '\"fuzz\"''")) {
                    ++matches;
                }
                if (table->matches("cmd", "bash -c 'id'")) {
                    ++mismatches;
                }
            }
        });
    }

    for (auto &thread : threads) { thread.join(); }

    EXPECT_EQ(matches.load(), thread_count * iterations);
    EXPECT_EQ(mismatches.load(), 0);
}

} // namespace
