// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdio>
#include <cstdlib>
#include <string_view>

#include <fmt/core.h>

#include "exception.hpp"
#include "log.hpp"

namespace checkdigit {

invalid_protected_string::invalid_protected_string(std::string_view value)
    : exception(fmt::format("invalid protected string '{}'", value)), value_(value)
{}

unknown_symbol::unknown_symbol(std::string_view symbol)
    : exception(fmt::format("unknown character '{}' in string", symbol)), symbol_(symbol)
{}

void fatal_error(std::string_view reason)
{
    CHECKDIGIT_ERROR("{}", reason);
    fmt::print(stderr, "checkdigit: fatal: {}\n", reason);
    std::abort();
}

} // namespace checkdigit
