// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "injhook.h"
#include "rule_table.hpp"

namespace injhook {

// Object behind an injhook_handle, exposes the table along with the C view of
// its hooks, whose strings point into the table itself.
class table_handle {
public:
    explicit table_handle(std::shared_ptr<const rule_table> table);
    ~table_handle() = default;
    table_handle(const table_handle &) = delete;
    table_handle(table_handle &&) = delete;
    table_handle &operator=(const table_handle &) = delete;
    table_handle &operator=(table_handle &&) = delete;

    [[nodiscard]] const rule_table &table() const { return *table_; }
    [[nodiscard]] const std::vector<injhook_hook> &hooks() const { return hooks_; }

protected:
    std::shared_ptr<const rule_table> table_;
    std::vector<injhook_hook> hooks_;
};

} // namespace injhook
