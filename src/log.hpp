// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>

#include <fmt/core.h> // IWYU pragma: keep

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
constexpr const char *base_name(const char *path)
{
    const char *base = path;
    while (*path != '\0') {
        if (*path++ == '/') {
            base = path;
        }
    }
    return base;
}

#define CHECKDIGIT_LOG_HELPER(level, function, file, line, fmt_str, ...)                           \
    {                                                                                              \
        if (checkdigit::logger::valid(level)) {                                                    \
            try {                                                                                  \
                constexpr const char *checkdigit_log_file_ = base_name(file);                      \
                auto checkdigit_log_message_ = fmt::format(fmt_str, ##__VA_ARGS__);               \
                checkdigit::logger::log(level, function, checkdigit_log_file_, line,               \
                    checkdigit_log_message_.c_str(), checkdigit_log_message_.size());              \
            } catch (const std::exception &) {}                                                    \
        }                                                                                          \
    }

#define CHECKDIGIT_LOG(level, fmt, ...)                                                            \
    CHECKDIGIT_LOG_HELPER(level, __func__, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define CHECKDIGIT_TRACE(fmt, ...) CHECKDIGIT_LOG(checkdigit::log_level::trace, fmt, ##__VA_ARGS__)
#define CHECKDIGIT_DEBUG(fmt, ...) CHECKDIGIT_LOG(checkdigit::log_level::debug, fmt, ##__VA_ARGS__)
#define CHECKDIGIT_INFO(fmt, ...) CHECKDIGIT_LOG(checkdigit::log_level::info, fmt, ##__VA_ARGS__)
#define CHECKDIGIT_WARN(fmt, ...) CHECKDIGIT_LOG(checkdigit::log_level::warn, fmt, ##__VA_ARGS__)
#define CHECKDIGIT_ERROR(fmt, ...) CHECKDIGIT_LOG(checkdigit::log_level::error, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace checkdigit {

// This enum is 32 bit for compatibility with CHECKDIGIT_LOG_LEVEL
// NOLINTNEXTLINE(performance-enum-size)
enum class log_level : uint32_t { trace, debug, info, warn, error, off };

inline std::string_view log_level_to_str(log_level level)
{
    switch (level) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::error:
        return "error";
    case log_level::warn:
        return "warn";
    case log_level::info:
        return "info";
    case log_level::off:
        break;
    }

    return "off";
}

class logger {
public:
    using log_cb_type = void (*)(log_level level, const char *function, const char *file,
        unsigned line, const char *message, uint64_t message_len);

    static void init(log_cb_type cb, log_level min_level);
    static bool valid(log_level level) { return cb != nullptr && level >= min_level; }
    static void log(log_level level, const char *function, const char *file, unsigned line,
        const char *message, size_t length);

private:
    static log_cb_type cb;
    static log_level min_level;
};

} // namespace checkdigit
