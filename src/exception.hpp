// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace injhook {

class exception : public std::exception {
public:
    explicit exception(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    std::string what_;
};

// Raised whenever a rule source can't be turned into a rule table
class parsing_error : public exception {
public:
    explicit parsing_error(const std::string &what) : exception(what) {}
};

class bad_cast : public exception {
public:
    bad_cast(std::string_view expected, std::string_view obtained)
        : exception("bad cast, expected '" + std::string{expected} + "', obtained '" +
                    std::string{obtained} + "'"),
          expected_(expected), obtained_(obtained)
    {}

    [[nodiscard]] const std::string &expected() const noexcept { return expected_; }
    [[nodiscard]] const std::string &obtained() const noexcept { return obtained_; }

protected:
    std::string expected_;
    std::string obtained_;
};

class missing_key : public parsing_error {
public:
    explicit missing_key(const std::string &key) : parsing_error("missing key '" + key + "'") {}
};

class invalid_type : public parsing_error {
public:
    invalid_type(const std::string &key, const bad_cast &e)
        : parsing_error("invalid type '" + e.obtained() + "' for key '" + key + "', expected '" +
                        e.expected() + "'")
    {}
};

class unknown_key : public parsing_error {
public:
    explicit unknown_key(const std::string &key) : parsing_error("unknown key '" + key + "'") {}
};

} // namespace injhook
