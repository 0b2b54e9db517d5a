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

namespace checkdigit {

// Base of all the errors reported by checksum operations on malformed input
class exception : public std::exception {
public:
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    explicit exception(std::string what) : what_(std::move(what)) {}
    std::string what_;
};

// The protected string is too short to contain the required check characters
class invalid_protected_string : public exception {
public:
    explicit invalid_protected_string(std::string_view value);

    [[nodiscard]] const std::string &value() const noexcept { return value_; }

protected:
    std::string value_;
};

// Strict decoding found a character absent from the symbol map
class unknown_symbol : public exception {
public:
    explicit unknown_symbol(std::string_view symbol);

    [[nodiscard]] const std::string &symbol() const noexcept { return symbol_; }

protected:
    std::string symbol_;
};

// Irrecoverable programmer error, such as a malformed symbol map. The reason
// is logged and written to stderr before the process is aborted.
[[noreturn]] void fatal_error(std::string_view reason);

} // namespace checkdigit
