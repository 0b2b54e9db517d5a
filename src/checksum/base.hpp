// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "checksum/protected_string.hpp"

namespace checkdigit {

class base_checksum {
public:
    base_checksum() = default;
    base_checksum(const base_checksum &) = default;
    base_checksum &operator=(const base_checksum &) = default;
    base_checksum(base_checksum &&) = default;
    base_checksum &operator=(base_checksum &&) = default;
    virtual ~base_checksum() = default;

    // The return value of this function should outlive the function scope,
    // for example, through a constexpr class static string_view initialised
    // with a literal.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    // Number of check characters appended to a protected string
    [[nodiscard]] virtual std::size_t check_length() const noexcept = 0;

    // Returns whether the trailing check characters of the protected string
    // match those computed from the rest of it.
    [[nodiscard]] virtual bool validate(std::string_view protected_str) const = 0;
    // Returns the unprotected string followed by its check characters
    [[nodiscard]] virtual std::string generate(std::string_view unprotected) const = 0;
    // Returns the check characters only
    [[nodiscard]] virtual std::string compute(std::string_view unprotected) const = 0;
};

template <typename T> class base_checksum_impl : public base_checksum {
public:
    base_checksum_impl() = default;
    ~base_checksum_impl() override = default;
    base_checksum_impl(const base_checksum_impl &) = default;
    base_checksum_impl(base_checksum_impl &&) noexcept = default;
    base_checksum_impl &operator=(const base_checksum_impl &) = default;
    base_checksum_impl &operator=(base_checksum_impl &&) noexcept = default;

    [[nodiscard]] std::string_view name() const noexcept override { return T::algorithm_name; }
    [[nodiscard]] std::size_t check_length() const noexcept override
    {
        return T::check_chars_length;
    }

    [[nodiscard]] bool validate(std::string_view protected_str) const override
    {
        auto [unprotected, check_chars] = split_tail(protected_str, T::check_chars_length);
        return check_chars == compute(unprotected);
    }

    [[nodiscard]] std::string generate(std::string_view unprotected) const override
    {
        return append(unprotected, compute(unprotected));
    }

    [[nodiscard]] std::string compute(std::string_view unprotected) const override
    {
        return static_cast<const T *>(this)->compute_impl(unprotected);
    }
};

} // namespace checkdigit
