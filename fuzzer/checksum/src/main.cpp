// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include "../../common/utils.hpp"
#include "checksum/luhn_checksum.hpp"
#include "checksum/protected_string.hpp"
#include "exception.hpp"

using namespace checkdigit_fuzzer;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    static const checkdigit::luhn_checksum lossy{true};
    static const checkdigit::luhn_checksum strict{false};

    auto input = bytes_to_string_view(data, size);

    // Lossy operations only fail on empty protected strings
    auto protected_str = lossy.generate(input);
    if (!lossy.validate(protected_str)) {
        std::abort();
    }

    try {
        auto check_chars = strict.compute(input);
        if (strict.generate(input) != checkdigit::append(input, check_chars)) {
            std::abort();
        }
    } catch (const checkdigit::unknown_symbol &) {}

    try {
        auto [head, tail] = checkdigit::split_tail(input, 2);
        if (head.size() + tail.size() != input.size()) {
            std::abort();
        }
        prevent_optimization(lossy.validate(input));
    } catch (const checkdigit::invalid_protected_string &) {}

    return 0;
}
