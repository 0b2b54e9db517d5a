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

#include "common/gtest_utils.hpp"

using namespace checkdigit;
using namespace std::literals;

namespace {

TEST(TestUTF8, CodepointToBytes)
{
    std::array<char, 4> buffer{};

    EXPECT_EQ(utf8::codepoint_to_bytes('A', buffer.data()), 1);
    EXPECT_STR(std::string_view(buffer.data(), 1), "A");

    EXPECT_EQ(utf8::codepoint_to_bytes(0xE9, buffer.data()), 2);
    EXPECT_STR(std::string_view(buffer.data(), 2), "é");

    EXPECT_EQ(utf8::codepoint_to_bytes(0x20AC, buffer.data()), 3);
    EXPECT_STR(std::string_view(buffer.data(), 3), "€");

    EXPECT_EQ(utf8::codepoint_to_bytes(0x1F600, buffer.data()), 4);
    EXPECT_STR(std::string_view(buffer.data(), 4), "😀");

    EXPECT_EQ(utf8::codepoint_to_bytes(UTF8_MAX_CODEPOINT + 1, buffer.data()), 0);
}

TEST(TestUTF8, AppendCodepoint)
{
    std::string str{"1"};
    EXPECT_TRUE(utf8::append_codepoint(0x20AC, str));
    EXPECT_TRUE(utf8::append_codepoint('2', str));
    EXPECT_STR(str, "1€2");

    EXPECT_FALSE(utf8::append_codepoint(UTF8_MAX_CODEPOINT + 1, str));
    EXPECT_STR(str, "1€2");
}

TEST(TestUTF8, FetchNextCodepoint)
{
    std::string_view str{"aé€😀"};
    std::size_t position = 0;

    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), 'a');
    EXPECT_EQ(position, 1);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), 0xE9);
    EXPECT_EQ(position, 3);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), 0x20AC);
    EXPECT_EQ(position, 6);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), 0x1F600);
    EXPECT_EQ(position, 10);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), UTF8_EOF);
    EXPECT_EQ(position, 10);
}

TEST(TestUTF8, FetchNextCodepointMalformed)
{
    // Lone continuation byte, then a truncated three byte sequence
    std::string_view str{"\x80" "a\xE2\x82"};
    std::size_t position = 0;

    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), UTF8_INVALID);
    EXPECT_EQ(position, 1);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), 'a');
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), UTF8_INVALID);
    EXPECT_EQ(position, 3);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), UTF8_INVALID);
    EXPECT_EQ(position, 4);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), UTF8_EOF);
}

TEST(TestUTF8, FetchNextCodepointNonCanonical)
{
    // Overlong '1' in two and three bytes, a surrogate half, then a
    // codepoint above U+10FFFF and a lead byte past 0xF4.
    for (std::string_view str :
        {"\xC0\xB1"sv, "\xE0\x80\xB1"sv, "\xED\xA0\x80"sv, "\xF4\x90\x80\x80"sv,
            "\xF5\x80\x80\x80"sv, "\xF0\x80\x80\xB1"sv}) {
        std::size_t position = 0;
        EXPECT_EQ(utf8::fetch_next_codepoint(str, position), UTF8_INVALID);
        EXPECT_EQ(position, 1);
        EXPECT_EQ(utf8::length(str), str.size());
    }

    // Boundaries right next to the rejected ranges
    std::string_view str{"\xC2\x80\xE0\xA0\x80\xED\x9F\xBF\xF0\x90\x80\x80\xF4\x8F\xBF\xBF"};
    std::size_t position = 0;
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), 0x80);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), 0x800);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), 0xD7FF);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), 0x10000);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), UTF8_MAX_CODEPOINT);
    EXPECT_EQ(utf8::fetch_next_codepoint(str, position), UTF8_EOF);
}

TEST(TestUTF8, Length)
{
    EXPECT_EQ(utf8::length(""), 0);
    EXPECT_EQ(utf8::length("helloworld"), 10);
    EXPECT_EQ(utf8::length("αβγ"), 3);
    EXPECT_EQ(utf8::length("1😀2"), 3);
    EXPECT_EQ(utf8::length("\xff\xfe"), 2);
}

} // namespace
