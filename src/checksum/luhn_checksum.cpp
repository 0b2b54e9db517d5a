// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "checksum/luhn_checksum.hpp"

namespace checkdigit {

luhn_checksum::luhn_checksum(bool lossy) : lossy_(lossy), symbols_(charset) {}

std::string luhn_checksum::compute_impl(std::string_view unprotected) const
{
    // Precomputed doubled values
    //   for num from 0 to 9: (2 * num) / 10 + (2 * num) % 10
    static constexpr std::array<uint8_t, 10> lut = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

    auto digits = lossy_ ? symbols_.decode_lossy(unprotected) : symbols_.decode(unprotected);

    // The rightmost digit of the unprotected string is doubled, as it ends up
    // second to last once the check digit is appended.
    unsigned sum = 0;
    bool should_double = true;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        sum = (sum + (should_double ? lut[*it] : *it)) % 10U;
        should_double = !should_double;
    }

    const std::array<uint8_t, 1> check_digit{static_cast<uint8_t>((10U - sum) % 10U)};
    return symbols_.encode(check_digit);
}

} // namespace checkdigit
