// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "utils.hpp"

namespace injhook {

inline std::string index_to_id(unsigned idx) { return "index:" + to_string<unsigned>(idx); }

enum class load_state : uint8_t { empty, invalid, valid };

// Diagnostics collected while loading a rule source
class load_info {
public:
    load_info() = default;
    ~load_info() = default;
    load_info(const load_info &) = delete;
    load_info(load_info &&) noexcept = default;
    load_info &operator=(const load_info &) = delete;
    load_info &operator=(load_info &&) noexcept = default;

    void set_error(std::string_view error) { error_ = error; }
    void add_loaded(std::string_view id) { loaded_.emplace_back(id); }
    void add_failed(std::string_view id, std::string_view error);

    [[nodiscard]] const std::string &error() const { return error_; }
    [[nodiscard]] const std::vector<std::string> &loaded() const { return loaded_; }
    [[nodiscard]] const std::vector<std::string> &failed() const { return failed_; }
    /** Map from an error string to all the ids for which that error was raised */
    [[nodiscard]] const std::map<std::string, std::vector<std::string>, std::less<>> &errors() const
    {
        return errors_;
    }

    [[nodiscard]] load_state state() const noexcept
    {
        if (!error_.empty() || !failed_.empty()) {
            return load_state::invalid;
        }
        return loaded_.empty() ? load_state::empty : load_state::valid;
    }

protected:
    std::string error_;
    std::vector<std::string> loaded_;
    std::vector<std::string> failed_;
    std::map<std::string, std::vector<std::string>, std::less<>> errors_;
};

} // namespace injhook
