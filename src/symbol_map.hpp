// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

#include "exception.hpp"
#include "utf8.hpp"

namespace checkdigit {

// Bijective mapping between the characters of a charset and the numerical
// values used by checksum arithmetic. Characters are UTF-8 encoded.
template <typename T> class symbol_map {
public:
    static_assert(std::is_unsigned_v<T> && !std::is_same_v<T, bool>,
        "symbol values must be of an unsigned integral type");

    using value_type = T;

    // Maps each character of the charset, in order, to the value at the same
    // index. Aborts if the lengths differ or if either side has duplicates.
    symbol_map(std::string_view symbols, std::span<const T> values)
    {
        auto codepoints = decode_charset(symbols);
        if (codepoints.size() != values.size()) {
            fatal_error(fmt::format(
                "charset '{}' has {} symbols but {} values were provided", symbols,
                codepoints.size(), values.size()));
        }

        symbol_to_value_.reserve(codepoints.size());
        value_to_symbol_.reserve(codepoints.size());
        for (std::size_t i = 0; i < codepoints.size(); ++i) {
            if (!symbol_to_value_.emplace(codepoints[i], values[i]).second) {
                fatal_error(fmt::format("duplicate symbol in charset '{}'", symbols));
            }
            if (!value_to_symbol_.emplace(values[i], codepoints[i]).second) {
                fatal_error(fmt::format(
                    "duplicate value {} in the values of charset '{}'", values[i], symbols));
            }
        }
    }

    symbol_map(std::string_view symbols, std::initializer_list<T> values)
        : symbol_map(symbols, std::span<const T>{values.begin(), values.size()})
    {}

    // Maps each character of the charset to its index (0, 1, 2, ...)
    explicit symbol_map(std::string_view symbols) : symbol_map(symbols, sequence(symbols)) {}

    symbol_map(const symbol_map &) = default;
    symbol_map &operator=(const symbol_map &) = default;
    symbol_map(symbol_map &&) noexcept = default;
    symbol_map &operator=(symbol_map &&) noexcept = default;
    ~symbol_map() = default;

    // Converts every character of the string into its value, throws
    // unknown_symbol on the first character which isn't part of the map.
    [[nodiscard]] std::vector<T> decode(std::string_view str) const
    {
        std::vector<T> values;
        values.reserve(str.size());

        std::size_t position = 0;
        while (true) {
            const std::size_t start = position;
            const uint32_t codepoint = utf8::fetch_next_codepoint(str, position);
            if (codepoint == UTF8_EOF) {
                break;
            }

            auto it = symbol_to_value_.find(codepoint);
            if (codepoint == UTF8_INVALID || it == symbol_to_value_.end()) {
                throw unknown_symbol(str.substr(start, position - start));
            }
            values.emplace_back(it->second);
        }

        return values;
    }

    // Converts the known characters of the string into their values, unknown
    // characters are ignored.
    [[nodiscard]] std::vector<T> decode_lossy(std::string_view str) const
    {
        std::vector<T> values;
        values.reserve(str.size());

        std::size_t position = 0;
        uint32_t codepoint;
        while ((codepoint = utf8::fetch_next_codepoint(str, position)) != UTF8_EOF) {
            auto it = symbol_to_value_.find(codepoint);
            if (it != symbol_to_value_.end()) {
                values.emplace_back(it->second);
            }
        }

        return values;
    }

    // Converts a sequence of values into the concatenation of their symbols,
    // aborts if a value doesn't belong to the map.
    [[nodiscard]] std::string encode(std::span<const T> values) const
    {
        std::string str;
        str.reserve(values.size());
        for (auto value : values) {
            auto it = value_to_symbol_.find(value);
            if (it == value_to_symbol_.end()) {
                fatal_error(fmt::format("value {} has no symbol", value));
            }
            if (!utf8::append_codepoint(it->second, str)) {
                fatal_error(fmt::format("symbol of value {} can't be encoded", value));
            }
        }
        return str;
    }

    [[nodiscard]] std::size_t size() const noexcept { return symbol_to_value_.size(); }

    bool operator==(const symbol_map &other) const = default;

protected:
    static std::vector<uint32_t> decode_charset(std::string_view symbols)
    {
        std::vector<uint32_t> codepoints;
        codepoints.reserve(symbols.size());

        std::size_t position = 0;
        uint32_t codepoint;
        while ((codepoint = utf8::fetch_next_codepoint(symbols, position)) != UTF8_EOF) {
            if (codepoint == UTF8_INVALID || codepoint > UTF8_MAX_CODEPOINT) {
                fatal_error(fmt::format(
                    "charset contains an invalid UTF-8 sequence before byte {}", position));
            }
            codepoints.emplace_back(codepoint);
        }
        return codepoints;
    }

    static std::vector<T> sequence(std::string_view symbols)
    {
        const std::size_t count = utf8::length(symbols);
        if (count > 0 && count - 1 > std::numeric_limits<T>::max()) {
            fatal_error(fmt::format(
                "charset '{}' has too many symbols for a {}-bit value", symbols, sizeof(T) * 8));
        }

        std::vector<T> values;
        values.reserve(count);
        for (std::size_t i = 0; i < count; ++i) { values.emplace_back(static_cast<T>(i)); }
        return values;
    }

    std::unordered_map<uint32_t, T> symbol_to_value_;
    std::unordered_map<T, uint32_t> value_to_symbol_;
};

} // namespace checkdigit
