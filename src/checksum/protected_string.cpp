// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "checksum/protected_string.hpp"
#include "exception.hpp"
#include "utf8.hpp"

namespace checkdigit {

std::pair<std::string_view, std::string_view> split_tail(std::string_view str, std::size_t n)
{
    const std::size_t length = utf8::length(str);
    if (length < n) {
        throw invalid_protected_string(str);
    }

    // Skip the characters belonging to the head
    std::size_t position = 0;
    for (std::size_t i = 0; i < length - n; ++i) { utf8::fetch_next_codepoint(str, position); }

    return {str.substr(0, position), str.substr(position)};
}

std::string append(std::string_view unprotected, std::string_view check_chars)
{
    std::string protected_str;
    protected_str.reserve(unprotected.size() + check_chars.size());
    protected_str.append(unprotected);
    protected_str.append(check_chars);
    return protected_str;
}

} // namespace checkdigit
