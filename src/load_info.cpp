// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <string_view>
#include <vector>

#include "load_info.hpp"

namespace injhook {

void load_info::add_failed(std::string_view id, std::string_view error)
{
    failed_.emplace_back(id);

    auto it = errors_.find(error);
    if (it == errors_.end()) {
        it = errors_.emplace(std::string{error}, std::vector<std::string>{}).first;
    }
    it->second.emplace_back(id);
}

} // namespace injhook
