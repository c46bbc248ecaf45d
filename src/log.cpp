// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <atomic>
#include <cstddef>

#include "log.hpp"

namespace injhook {

std::atomic<logger::log_cb_type> logger::cb_{nullptr};
std::atomic<log_level> logger::min_level_{log_level::off};

void logger::init(log_cb_type cb, log_level min_level) noexcept
{
    // The level is published before the callback becomes visible
    min_level_.store(min_level, std::memory_order_relaxed);
    cb_.store(cb, std::memory_order_release);
}

void logger::log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, size_t length)
{
    auto *cb = cb_.load(std::memory_order_acquire);
    if (cb != nullptr) {
        cb(level, function, file, line, message, length);
    }
}

} // namespace injhook
