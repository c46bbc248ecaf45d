// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "common/gtest_utils.hpp"
#include "log.hpp"

using namespace injhook;
using ::testing::ElementsAre;

namespace {

struct log_entry {
    log_level level;
    std::string function;
    std::string file;
    std::string message;
};

std::vector<log_entry> entries;
std::atomic<unsigned> counter{0};

void capture_cb(log_level level, const char *function, const char *file, unsigned /*line*/,
    const char *message, uint64_t message_len)
{
    entries.emplace_back(log_entry{level, function, file, std::string(message, message_len)});
}

void count_cb(log_level /*level*/, const char * /*function*/, const char * /*file*/,
    unsigned /*line*/, const char * /*message*/, uint64_t /*message_len*/)
{
    ++counter;
}

class TestLogger : public ::testing::Test {
public:
    void SetUp() override
    {
        previous_cb_ = logger::callback();
        previous_level_ = logger::min_level();
        entries.clear();
        counter = 0;
    }

    void TearDown() override { logger::init(previous_cb_, previous_level_); }

protected:
    logger::log_cb_type previous_cb_{nullptr};
    log_level previous_level_{log_level::off};
};

TEST_F(TestLogger, MinimumLevel)
{
    logger::init(capture_cb, log_level::warn);
    EXPECT_EQ(logger::callback(), &capture_cb);
    EXPECT_EQ(logger::min_level(), log_level::warn);

    INJHOOK_DEBUG("hidden {}", 1);
    INJHOOK_WARN("hook {} param {}", "system", 0);
    INJHOOK_ERROR("failed");

    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].level, log_level::warn);
    EXPECT_STR(entries[0].message, "hook system param 0");
    EXPECT_STR(entries[0].file, "log_test.cpp");
    EXPECT_STR(entries[0].function, "TestBody");
    EXPECT_EQ(entries[1].level, log_level::error);
}

TEST_F(TestLogger, Disabled)
{
    logger::init(capture_cb, log_level::off);
    EXPECT_FALSE(logger::valid(log_level::error));
    INJHOOK_ERROR("dropped");

    logger::init(nullptr, log_level::trace);
    EXPECT_FALSE(logger::valid(log_level::trace));
    INJHOOK_ERROR("dropped");
    logger::log(log_level::error, "f", "file", 1, "dropped", 7);

    EXPECT_TRUE(entries.empty());
}

TEST_F(TestLogger, CallbackReplacedWhileLogging)
{
    logger::init(count_cb, log_level::trace);

    constexpr unsigned thread_count = 4;
    constexpr unsigned iterations = 1000;

    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (unsigned t = 0; t < thread_count; ++t) {
        threads.emplace_back([]() {
            for (unsigned i = 0; i < iterations; ++i) { INJHOOK_TRACE("iteration {}", i); }
        });
    }

    for (unsigned i = 0; i < iterations; ++i) {
        logger::init(i % 2 == 0 ? nullptr : count_cb, log_level::trace);
    }
    logger::init(count_cb, log_level::trace);

    for (auto &thread : threads) { thread.join(); }

    EXPECT_LE(counter.load(), thread_count * iterations);
}

TEST(TestLogLevel, ToString)
{
    std::vector<std::string_view> names;
    for (auto level : {log_level::trace, log_level::debug, log_level::info, log_level::warn,
             log_level::error, log_level::off}) {
        names.emplace_back(log_level_to_str(level));
    }
    EXPECT_THAT(names, ElementsAre("trace", "debug", "info", "warn", "error", "off"));
}

} // namespace
