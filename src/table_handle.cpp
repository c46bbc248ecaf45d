// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <memory>
#include <utility>
#include <variant>

#include "function_ref.hpp"
#include "injhook.h"
#include "rule_table.hpp"
#include "table_handle.hpp"

namespace injhook {

table_handle::table_handle(std::shared_ptr<const rule_table> table) : table_(std::move(table))
{
    hooks_.reserve(table_->hooks().size());
    for (const auto &target : table_->hooks()) {
        injhook_hook c_hook{};
        if (const auto *addr = std::get_if<address>(&target.function); addr != nullptr) {
            c_hook.type = INJHOOK_FUNCTION_ADDRESS;
            c_hook.symbol = nullptr;
            c_hook.address = addr->value;
        } else {
            c_hook.type = INJHOOK_FUNCTION_SYMBOL;
            c_hook.symbol = std::get<symbol>(target.function).name.c_str();
            c_hook.address = 0;
        }
        c_hook.param_index = target.param_index;
        c_hook.group_index = static_cast<uint32_t>(target.group_index);
        hooks_.emplace_back(c_hook);
    }
}

} // namespace injhook
