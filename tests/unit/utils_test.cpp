// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <string_view>
#include <utility>

#include "common/gtest_utils.hpp"
#include "utils.hpp"

using namespace injhook;
using namespace std::literals;

namespace {

TEST(TestUtils, ToLower)
{
    EXPECT_STR(to_lower("SELECT * FROM Users"), "select * from users");
    EXPECT_STR(to_lower("'\"FUZZ\"'"), "'\"fuzz\"'");
    EXPECT_STR(to_lower(""), "");
    // Non-ASCII bytes are left untouched
    EXPECT_STR(to_lower("\xC3\x89T\xC3\x89"), "\xC3\x89t\xC3\x89");
}

TEST(TestUtils, StringIequals)
{
    EXPECT_TRUE(string_iequals("aarch64", "AArch64"));
    EXPECT_TRUE(string_iequals("", ""));
    EXPECT_FALSE(string_iequals("x86", "x86_64"));
    EXPECT_FALSE(string_iequals("arm", "mips"));
}

TEST(TestUtils, CaseInsensitiveFind)
{
    EXPECT_EQ(ifind("SELECT 1", "select"), 0U);
    EXPECT_EQ(ifind("echo $(FUZZ)", "$(fuzz)"), 5U);
    EXPECT_EQ(ifind("abc", "abcd"), std::string_view::npos);
    EXPECT_EQ(ifind("abc", "d"), std::string_view::npos);
    EXPECT_EQ(ifind("", "a"), std::string_view::npos);
    EXPECT_EQ(ifind("abc", ""), 0U);
    // The needle is expected to be lowercase already
    EXPECT_EQ(ifind("abc", "ABC"), std::string_view::npos);
}

TEST(TestUtils, FromString)
{
    EXPECT_EQ(from_string<unsigned>("5"), std::make_pair(true, 5U));
    EXPECT_EQ(from_string<int64_t>("-1"), std::make_pair(true, int64_t{-1}));
    EXPECT_FALSE(from_string<unsigned>("5a").first);
    EXPECT_FALSE(from_string<unsigned>("").first);
    EXPECT_FALSE(from_string<int64_t>("1.5").first);
}

} // namespace
