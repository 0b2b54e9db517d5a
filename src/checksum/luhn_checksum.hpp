// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "checksum/base.hpp"
#include "symbol_map.hpp"

namespace checkdigit {

class luhn_checksum : public base_checksum_impl<luhn_checksum> {
public:
    static constexpr std::string_view algorithm_name = "luhn";
    static constexpr std::string_view charset = "0123456789";
    static constexpr std::size_t check_chars_length = 1;

    // A lossy instance ignores the characters outside of the charset, such as
    // separators, while a strict one rejects them with unknown_symbol.
    explicit luhn_checksum(bool lossy = true);
    luhn_checksum(const luhn_checksum &) = default;
    luhn_checksum &operator=(const luhn_checksum &) = default;
    luhn_checksum(luhn_checksum &&) noexcept = default;
    luhn_checksum &operator=(luhn_checksum &&) noexcept = default;
    ~luhn_checksum() override = default;

    [[nodiscard]] bool lossy() const noexcept { return lossy_; }

protected:
    [[nodiscard]] std::string compute_impl(std::string_view unprotected) const;

    bool lossy_;
    symbol_map<uint8_t> symbols_;

    friend class base_checksum_impl<luhn_checksum>;
};

} // namespace checkdigit
