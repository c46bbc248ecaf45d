// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdio>
#include <string>
#include <system_error>

#include "common/gtest_utils.hpp"
#include "dictionary.hpp"
#include "loader.hpp"
#include "rule_table.hpp"

using namespace injhook;
using ::testing::HasSubstr;

namespace {

TEST(TestDictionary, EscapeToken)
{
    EXPECT_STR(escape_dictionary_token("FUZZ"), "FUZZ");
    EXPECT_STR(escape_dictionary_token("'\"FUZZ\"'"), "'\\\"FUZZ\\\"'");
    EXPECT_STR(escape_dictionary_token("a\\b"), "a\\\\b");
    EXPECT_STR(escape_dictionary_token("'\"\"'\"\n"), "'\\\"\\\"'\\\"\\x0A");
    EXPECT_STR(escape_dictionary_token(std::string("\0\x7f\xff", 3)), "\\x00\\x7F\\xFF");
    EXPECT_STR(escape_dictionary_token(""), "");
}

TEST(TestDictionary, TokensPerGroup)
{
    auto table = load(R"yaml(
cmd:
  tokens: ["'\"FUZZ\"'", "$(FUZZ)"]
ldap:
  tokens: ["*)(FUZZ=*))(|"]
no_tokens:
  matches: ["x"]
)yaml");

    EXPECT_STR(to_dictionary(table), "cmd_0=\"'\\\"FUZZ\\\"'\"\n"
                                     "cmd_1=\"$(FUZZ)\"\n"
                                     "ldap_0=\"*)(FUZZ=*))(|\"\n");
}

TEST(TestDictionary, KeywordFromGroupName)
{
    auto table = load(R"yaml(
"sql-injection v2":
  tokens: ["1=1"]
)yaml");

    EXPECT_STR(to_dictionary(table), "sql_injection_v2_0=\"1=1\"\n");
}

TEST(TestDictionary, EmptyTable) { EXPECT_TRUE(to_dictionary(rule_table{}).empty()); }

TEST(TestDictionary, FixtureHasEveryToken)
{
    auto table = load(test::read_rule_file("injections.yaml"));
    auto dict = to_dictionary(table);

    EXPECT_THAT(dict, HasSubstr("sql_1=\"\\\"1\\\" OR '1'=\\\"1\\\"\"\n"));
    EXPECT_THAT(dict, HasSubstr("cmd_3=\"$(FUZZ)\"\n"));
    EXPECT_THAT(dict, HasSubstr("xss_0=\"'\\\"><FUZZ\"\n"));

    std::size_t lines = 0;
    for (auto c : dict) { lines += c == '\n' ? 1 : 0; }
    EXPECT_EQ(lines, 8);
}

TEST(TestDictionary, WriteToFile)
{
    auto table = load(test::read_rule_file("injections.json"));

    std::string path = ::testing::TempDir() + "injhook_dictionary_test.dict";
    write_dictionary(table, path);

    EXPECT_STR(read_file(path), to_dictionary(table));
    std::remove(path.c_str());
}

TEST(TestDictionary, WriteToInvalidPath)
{
    auto table = load(test::read_rule_file("injections.json"));
    EXPECT_THROW(write_dictionary(table, "/nonexistent/directory/tokens.dict"), std::system_error);
}

} // namespace
