// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <memory>
#include <stdexcept>
#include <string_view>

#include <fmt/core.h>

#include "builder/checksum_builder.hpp"
#include "checksum/base.hpp"
#include "checksum/luhn_checksum.hpp"
#include "log.hpp"

namespace checkdigit {

std::unique_ptr<base_checksum> checksum_builder::build(
    std::string_view name, const checksum_options &options)
{
    if (name == luhn_checksum::algorithm_name) {
        CHECKDIGIT_DEBUG(
            "Building luhn checksum with {} decoding", options.lossy ? "lossy" : "strict");
        return std::make_unique<luhn_checksum>(options.lossy);
    }

    throw std::invalid_argument(fmt::format("unknown checksum algorithm: '{}'", name));
}

} // namespace checkdigit
