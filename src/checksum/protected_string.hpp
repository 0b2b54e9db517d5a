// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace checkdigit {

// Splits a protected string into (head, tail) where tail holds its last n
// characters. Throws invalid_protected_string if the string has fewer than n
// characters.
std::pair<std::string_view, std::string_view> split_tail(std::string_view str, std::size_t n);

std::string append(std::string_view unprotected, std::string_view check_chars);

} // namespace checkdigit
