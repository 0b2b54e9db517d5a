// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include "checksum/protected_string.hpp"
#include "exception.hpp"

#include "common/gtest_utils.hpp"

using namespace checkdigit;

namespace {

TEST(TestProtectedString, SplitTail)
{
    {
        auto [head, tail] = split_tail("helloworld", 5);
        EXPECT_STR(head, "hello");
        EXPECT_STR(tail, "world");
    }

    {
        auto [head, tail] = split_tail("79927398713", 1);
        EXPECT_STR(head, "7992739871");
        EXPECT_STR(tail, "3");
    }

    {
        auto [head, tail] = split_tail("5", 1);
        EXPECT_STR(head, "");
        EXPECT_STR(tail, "5");
    }

    {
        auto [head, tail] = split_tail("abc", 0);
        EXPECT_STR(head, "abc");
        EXPECT_STR(tail, "");
    }
}

TEST(TestProtectedString, SplitTailMultiByte)
{
    {
        auto [head, tail] = split_tail("αβγδ", 1);
        EXPECT_STR(head, "αβγ");
        EXPECT_STR(tail, "δ");
    }

    {
        auto [head, tail] = split_tail("12😀€", 2);
        EXPECT_STR(head, "12");
        EXPECT_STR(tail, "😀€");
    }

    {
        auto [head, tail] = split_tail("€", 1);
        EXPECT_STR(head, "");
        EXPECT_STR(tail, "€");
    }
}

TEST(TestProtectedString, SplitTailNonCanonicalUTF8)
{
    // Each byte of a non-canonical sequence is a character of its own
    {
        auto [head, tail] = split_tail("\xC0\xB1", 1);
        EXPECT_STR(head, "\xC0");
        EXPECT_STR(tail, "\xB1");
    }

    {
        auto [head, tail] = split_tail("1\xE0\x80\xB1", 2);
        EXPECT_STR(head, "1\xE0");
        EXPECT_STR(tail, "\x80\xB1");
    }

    {
        auto [head, tail] = split_tail("\xED\xA0\x80", 3);
        EXPECT_STR(head, "");
        EXPECT_STR(tail, "\xED\xA0\x80");
    }

    EXPECT_THROW(split_tail("\xED\xA0\x80", 4), invalid_protected_string);
}

TEST(TestProtectedString, SplitTailTooShort)
{
    EXPECT_THROW(split_tail("", 1), invalid_protected_string);
    EXPECT_THROW(split_tail("ab", 3), invalid_protected_string);
    // Two characters but six bytes
    EXPECT_THROW(split_tail("€€", 3), invalid_protected_string);

    try {
        split_tail("", 1);
        FAIL() << "expected invalid_protected_string";
    } catch (const invalid_protected_string &e) {
        EXPECT_STR(e.value(), "");
        EXPECT_STR(e.what(), "invalid protected string ''");
    }

    try {
        split_tail("ab", 3);
        FAIL() << "expected invalid_protected_string";
    } catch (const invalid_protected_string &e) {
        EXPECT_STR(e.value(), "ab");
        EXPECT_STR(e.what(), "invalid protected string 'ab'");
    }
}

TEST(TestProtectedString, Append)
{
    EXPECT_STR(append("hello", "world"), "helloworld");
    EXPECT_STR(append("7992739871", "3"), "79927398713");
    EXPECT_STR(append("", "0"), "0");
    EXPECT_STR(append("αβ", "γ"), "αβγ");
}

} // namespace
