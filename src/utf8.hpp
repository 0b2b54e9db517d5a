// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2022 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define UTF8_MAX_CODEPOINT 0x10FFFF
#define UTF8_INVALID 0xFFFFFFFF
#define UTF8_EOF 0xFFFFFFFE
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace checkdigit::utf8 {

// Writes up to 4 bytes into the buffer, returns the number of bytes written or
// 0 if the codepoint is out of range.
uint8_t codepoint_to_bytes(uint32_t codepoint, char *utf8_buffer);

// Appends the UTF-8 representation of the codepoint, returns false if the
// codepoint is out of range.
bool append_codepoint(uint32_t codepoint, std::string &output);

// Decodes the codepoint starting at position and moves position past it.
// Returns UTF8_EOF at the end of the string and UTF8_INVALID for a malformed
// sequence, in which case position is only moved forward by one byte.
uint32_t fetch_next_codepoint(std::string_view str, std::size_t &position);

// Number of characters in the string, a malformed byte counts as one.
std::size_t length(std::string_view str);

} // namespace checkdigit::utf8
