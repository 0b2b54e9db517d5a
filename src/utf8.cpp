// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2022 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "utf8.hpp"

namespace checkdigit::utf8 {

namespace {

int8_t find_next_sequence_length(std::string_view str, std::size_t position)
{
    const std::size_t length_left = str.size() - position;
    if (length_left == 0) {
        return 0;
    }

    // Valid UTF8 has a specific binary format.
    //  If it's a single byte UTF8 character, then it is always of form '0xxxxxxx', where 'x' is any
    //  binary digit. If it's a two byte UTF8 character, then it's always of form '110xxxxx
    //  10xxxxxx'. Similarly for three and four byte UTF8 characters it starts with '1110xxxx' and
    //  '11110xxx' followed by '10xxxxxx' one less times as there are bytes.

    const auto first_byte = static_cast<uint8_t>(str[position]);
    int8_t expected_length = -1;

    // Looking for 0xxxxxxx
    if ((first_byte & 0x80) == 0) {
        return 1;
    }

    // Looking for 110xxxxx
    if ((first_byte >> 5) == 0x6) {
        expected_length = 2;
    }
    // Looking for 1110xxxx
    else if ((first_byte >> 4) == 0xe) {
        expected_length = 3;
    }
    // Looking for 11110xxx
    else if ((first_byte >> 3) == 0x1e) {
        expected_length = 4;
    }

    // If we found a valid prefix, we check that it makes sense based on the length left
    if (expected_length < 0 || static_cast<std::size_t>(expected_length) > length_left) {
        return -1;
    }

    // Every byte in the sequence must be prefixed by 10xxxxxx
    for (int8_t i = 1; i < expected_length; ++i) {
        if ((static_cast<uint8_t>(str[position + i]) >> 6) != 0x2) {
            return -1;
        }
    }

    // Reject overlong encodings, surrogates (U+D800-U+DFFF) and codepoints
    // above UTF8_MAX_CODEPOINT, all of which are structurally well formed.
    const auto second_byte = static_cast<uint8_t>(str[position + 1]);
    switch (first_byte) {
    case 0xC0:
    case 0xC1:
        return -1;
    case 0xE0:
        if (second_byte < 0xA0) {
            return -1;
        }
        break;
    case 0xED:
        if (second_byte > 0x9F) {
            return -1;
        }
        break;
    case 0xF0:
        if (second_byte < 0x90) {
            return -1;
        }
        break;
    case 0xF4:
        if (second_byte > 0x8F) {
            return -1;
        }
        break;
    default:
        if (first_byte > 0xF4) {
            return -1;
        }
        break;
    }

    return expected_length;
}

} // namespace

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
uint8_t codepoint_to_bytes(uint32_t codepoint, char *utf8_buffer)
{
    // Handle the easy case of ASCII
    if (codepoint <= 0x7F) {
        *utf8_buffer = static_cast<char>(codepoint);
        return 1;
    }

    /*
     There are multiple representations depending of the codepoint:
     0x000000-0x00007F: 0xxxxxxx
     0x000080-0x0007FF: 110xxxxx 10xxxxxx
     0x000800-0x00FFFF: 1110xxxx 10xxxxxx 10xxxxxx
     0x010000-0x10FFFF: 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
     */

    // Out of range codepoint
    if (codepoint > UTF8_MAX_CODEPOINT) {
        return 0;
    }

    // 4 bytes representation
    if (codepoint > 0xFFFF) {
        *utf8_buffer++ = static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07));
        *utf8_buffer++ = static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        *utf8_buffer++ = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        *utf8_buffer = static_cast<char>(0x80 | (codepoint & 0x3F));
        return 4;
    }

    // Three bytes
    if (codepoint > 0x7FF) {
        *utf8_buffer++ = static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F));
        *utf8_buffer++ = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        *utf8_buffer = static_cast<char>(0x80 | (codepoint & 0x3F));
        return 3;
    }

    // Two bytes
    *utf8_buffer++ = static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F));
    *utf8_buffer = static_cast<char>(0x80 | (codepoint & 0x3F));
    return 2;
}
// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

bool append_codepoint(uint32_t codepoint, std::string &output)
{
    std::array<char, 4> buffer{};
    auto written = codepoint_to_bytes(codepoint, buffer.data());
    if (written == 0) {
        return false;
    }

    output.append(buffer.data(), written);
    return true;
}

uint32_t fetch_next_codepoint(std::string_view str, std::size_t &position)
{
    if (position > str.size()) {
        return UTF8_INVALID;
    }

    const int8_t sequence_length = find_next_sequence_length(str, position);
    if (sequence_length == 0) {
        return UTF8_EOF;
    }

    if (sequence_length < 0) {
        position += 1;
        return UTF8_INVALID;
    }

    if (sequence_length == 1) {
        return static_cast<uint8_t>(str[position++]);
    }

    // The header byte carries a variable amount of bits depending on the length
    //  2 bytes: 110xxxxx -> & 00011111
    //  3 bytes: 1110xxxx -> & 00001111
    //  4 bytes: 11110xxx -> & 00000111
    uint32_t codepoint = static_cast<uint8_t>(str[position]) & (0xFFU >> (sequence_length + 1));

    // Continuation bytes are formatted like 10xxxxxx, each adds 6 bits
    for (int8_t i = 1; i < sequence_length; ++i) {
        codepoint <<= 6;
        codepoint |= static_cast<uint8_t>(str[position + i]) & 0x3FU;
    }

    position += static_cast<std::size_t>(sequence_length);
    return codepoint;
}

std::size_t length(std::string_view str)
{
    std::size_t count = 0;
    std::size_t position = 0;
    while (fetch_next_codepoint(str, position) != UTF8_EOF) { ++count; }
    return count;
}

} // namespace checkdigit::utf8
