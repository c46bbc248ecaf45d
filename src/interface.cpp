// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string_view>
#include <utility>

#include "configuration/parser_config.hpp"
#include "injhook.h"
#include "loader.hpp"
#include "log.hpp"
#include "rule_table.hpp"
#include "table_handle.hpp"
#include "version.hpp"

using namespace injhook;

// Log level compatibility
static_assert(static_cast<uint32_t>(log_level::trace) == INJHOOK_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == INJHOOK_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == INJHOOK_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == INJHOOK_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == INJHOOK_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == INJHOOK_LOG_OFF);

namespace {

std::atomic<injhook_log_cb> binding_log_cb{nullptr};

void forward_log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t message_len)
{
    auto *cb = binding_log_cb.load(std::memory_order_acquire);
    if (cb != nullptr) {
        cb(static_cast<INJHOOK_LOG_LEVEL>(level), function, file, line, message, message_len);
    }
}

parser_config config_from_c(const injhook_config *config)
{
    parser_config cfg;
    if (config != nullptr) {
        if (config->max_param_index >= 0) {
            cfg.max_param_index = static_cast<unsigned>(config->max_param_index);
        } else if (config->architecture != nullptr) {
            cfg.max_param_index = max_param_index_for(config->architecture);
        }
    }
    return cfg;
}

const rule_group *group_at(const injhook_handle handle, uint32_t group_index)
{
    if (handle == nullptr) {
        return nullptr;
    }

    const auto &groups = handle->table().groups();
    if (group_index >= groups.size()) {
        return nullptr;
    }
    return &groups[group_index];
}

std::string_view to_view(const char *value, size_t length)
{
    if (value == nullptr) {
        return {};
    }
    return {value, length};
}

} // namespace

// NOLINTBEGIN(cppcoreguidelines-owning-memory)
extern "C" {

injhook::table_handle *injhook_init(
    const char *source, size_t length, const injhook_config *config)
{
    if (source == nullptr) {
        return nullptr;
    }

    try {
        auto table = std::make_shared<const rule_table>(load({source, length}, config_from_c(config)));
        return new table_handle{std::move(table)};
    } catch (const std::exception &e) {
        INJHOOK_ERROR("{}", e.what());
    } catch (...) {
        INJHOOK_ERROR("unknown exception");
    }

    return nullptr;
}

injhook::table_handle *injhook_init_file(const char *path, const injhook_config *config)
{
    if (path == nullptr) {
        return nullptr;
    }

    try {
        auto table = std::make_shared<const rule_table>(load_file(path, config_from_c(config)));
        return new table_handle{std::move(table)};
    } catch (const std::exception &e) {
        INJHOOK_ERROR("{}", e.what());
    } catch (...) {
        INJHOOK_ERROR("unknown exception");
    }

    return nullptr;
}

void injhook_destroy(injhook::table_handle *handle)
{
    try {
        delete handle;
    } catch (const std::exception &e) {
        INJHOOK_ERROR("{}", e.what());
    } catch (...) {
        INJHOOK_ERROR("unknown exception");
    }
}

uint32_t injhook_group_count(injhook::table_handle *const handle)
{
    if (handle == nullptr) {
        return 0;
    }
    return static_cast<uint32_t>(handle->table().size());
}

const char *injhook_group_name(injhook::table_handle *const handle, uint32_t group_index)
{
    const auto *group = group_at(handle, group_index);
    return group != nullptr ? group->name().c_str() : nullptr;
}

bool injhook_group_index(
    injhook::table_handle *const handle, const char *name, uint32_t *group_index)
{
    if (handle == nullptr || name == nullptr || group_index == nullptr) {
        return false;
    }

    auto index = handle->table().group_index(name);
    if (!index.has_value()) {
        return false;
    }

    *group_index = static_cast<uint32_t>(*index);
    return true;
}

uint32_t injhook_token_count(injhook::table_handle *const handle, uint32_t group_index)
{
    const auto *group = group_at(handle, group_index);
    return group != nullptr ? static_cast<uint32_t>(group->tokens().size()) : 0;
}

const char *injhook_token(injhook::table_handle *const handle, uint32_t group_index,
    uint32_t token_index, size_t *length)
{
    const auto *group = group_at(handle, group_index);
    if (group == nullptr || token_index >= group->tokens().size()) {
        return nullptr;
    }

    const auto &token = group->tokens()[token_index];
    if (length != nullptr) {
        *length = token.size();
    }
    return token.c_str();
}

const injhook_hook *injhook_hooks(injhook::table_handle *const handle, uint32_t *size)
{
    if (size == nullptr) {
        return nullptr;
    }

    if (handle == nullptr || handle->hooks().empty()) {
        *size = 0;
        return nullptr;
    }

    const auto &hooks = handle->hooks();
    *size = static_cast<uint32_t>(hooks.size());
    return hooks.data();
}

bool injhook_match(injhook::table_handle *const handle, uint32_t group_index, const char *value,
    size_t length)
{
    if (handle == nullptr) {
        return false;
    }
    return handle->table().matches(static_cast<std::size_t>(group_index), to_view(value, length));
}

bool injhook_match_group(
    injhook::table_handle *const handle, const char *group, const char *value, size_t length)
{
    if (handle == nullptr || group == nullptr) {
        return false;
    }
    return handle->table().matches(std::string_view{group}, to_view(value, length));
}

bool injhook_set_log_cb(injhook_log_cb cb, INJHOOK_LOG_LEVEL min_level)
{
    binding_log_cb.store(cb, std::memory_order_release);
    logger::init(cb != nullptr ? forward_log : nullptr, static_cast<log_level>(min_level));
    INJHOOK_INFO("Sending log messages to binding, min level {}",
        log_level_to_str(static_cast<log_level>(min_level)));
    return true;
}

const char *injhook_get_version() { return current_version.data(); }

} // extern "C"
// NOLINTEND(cppcoreguidelines-owning-memory)
