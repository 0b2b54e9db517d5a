// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <cstring>
#include <exception>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include "builder/checksum_builder.hpp"
#include "checkdigit.h"
#include "checksum/base.hpp"
#include "checksum/luhn_checksum.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "version.hpp"

using namespace checkdigit;

// Log level compatibility
static_assert(static_cast<uint32_t>(log_level::trace) == CHECKDIGIT_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == CHECKDIGIT_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == CHECKDIGIT_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == CHECKDIGIT_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == CHECKDIGIT_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == CHECKDIGIT_LOG_OFF);

namespace {

checkdigit_log_cb binding_log_cb = nullptr;

void relay_log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t message_len)
{
    binding_log_cb(
        static_cast<CHECKDIGIT_LOG_LEVEL>(level), function, file, line, message, message_len);
}

bool to_string(const std::string &value, checkdigit_string *result)
{
    if (value.size() > std::numeric_limits<uint32_t>::max()) {
        return false;
    }

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    auto *buffer = new char[value.size() + 1];
    std::memcpy(buffer, value.c_str(), value.size() + 1);

    result->ptr = buffer;
    result->length = static_cast<uint32_t>(value.size());
    return true;
}

template <typename Fn>
CHECKDIGIT_RET_CODE run_checked(
    checkdigit_handle handle, const char *str, const void *result, Fn &&fn)
{
    if (handle == nullptr || str == nullptr || result == nullptr) {
        CHECKDIGIT_DEBUG("Invalid argument, null handle, string or result");
        return CHECKDIGIT_ERR_INVALID_ARGUMENT;
    }

    try {
        return fn();
    } catch (const invalid_protected_string &e) {
        CHECKDIGIT_DEBUG("{}", e.what());
        return CHECKDIGIT_ERR_INVALID_PROTECTED_STRING;
    } catch (const unknown_symbol &e) {
        CHECKDIGIT_DEBUG("{}", e.what());
        return CHECKDIGIT_ERR_UNKNOWN_SYMBOL;
    } catch (const std::exception &e) {
        CHECKDIGIT_ERROR("{}", e.what());
    } catch (...) {
        CHECKDIGIT_ERROR("unknown exception");
    }

    return CHECKDIGIT_ERR_INTERNAL;
}

} // namespace

extern "C" {

checkdigit::base_checksum *checkdigit_init(const checkdigit_config *config)
{
    try {
        std::string_view algorithm = luhn_checksum::algorithm_name;
        checksum_options options;
        if (config != nullptr) {
            if (config->algorithm != nullptr) {
                algorithm = config->algorithm;
            }
            options.lossy = !config->strict;
        }

        return checksum_builder::build(algorithm, options).release();
    } catch (const std::exception &e) {
        CHECKDIGIT_ERROR("{}", e.what());
    } catch (...) {
        CHECKDIGIT_ERROR("unknown exception");
    }

    return nullptr;
}

void checkdigit_destroy(checkdigit::base_checksum *handle)
{
    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    delete handle;
}

CHECKDIGIT_RET_CODE checkdigit_compute(
    checkdigit::base_checksum *handle, const char *str, uint32_t length, checkdigit_string *result)
{
    return run_checked(handle, str, result, [&]() {
        if (!to_string(handle->compute({str, length}), result)) {
            return CHECKDIGIT_ERR_INTERNAL;
        }
        return CHECKDIGIT_OK;
    });
}

CHECKDIGIT_RET_CODE checkdigit_generate(
    checkdigit::base_checksum *handle, const char *str, uint32_t length, checkdigit_string *result)
{
    return run_checked(handle, str, result, [&]() {
        if (!to_string(handle->generate({str, length}), result)) {
            return CHECKDIGIT_ERR_INTERNAL;
        }
        return CHECKDIGIT_OK;
    });
}

CHECKDIGIT_RET_CODE checkdigit_validate(
    checkdigit::base_checksum *handle, const char *str, uint32_t length, bool *valid)
{
    return run_checked(handle, str, valid, [&]() {
        *valid = handle->validate({str, length});
        return CHECKDIGIT_OK;
    });
}

void checkdigit_string_free(checkdigit_string *str)
{
    if (str == nullptr) {
        return;
    }

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    delete[] str->ptr;
    str->ptr = nullptr;
    str->length = 0;
}

const char *checkdigit_get_version() { return checkdigit::current_version.data(); }

bool checkdigit_set_log_cb(checkdigit_log_cb cb, CHECKDIGIT_LOG_LEVEL min_level)
{
    binding_log_cb = cb;
    logger::init(cb != nullptr ? relay_log : nullptr, static_cast<log_level>(min_level));
    CHECKDIGIT_INFO("Sending log messages to binding, min level {}",
        log_level_to_str(static_cast<log_level>(min_level)));
    return true;
}
}
