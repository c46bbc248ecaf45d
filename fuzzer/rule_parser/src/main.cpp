// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>

#include "exception.hpp"
#include "loader.hpp"
#include "serializer.hpp"

using namespace injhook;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *bytes, size_t size)
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    std::string_view source{reinterpret_cast<const char *>(bytes), size};

    try {
        auto table = load(source);

        // Whatever was accepted must survive a round trip
        auto reloaded = load(serialize(table));
        if (reloaded.hooks() != table.hooks()) {
            __builtin_trap();
        }
    } catch (const injhook::exception &) {
        // Rejected sources are expected
    }

    return 0;
}
