// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <string_view>

#include "checksum/base.hpp"

namespace checkdigit {

struct checksum_options {
    bool lossy{true};
};

struct checksum_builder {
    // Throws std::invalid_argument if the algorithm is unknown
    static std::unique_ptr<base_checksum> build(
        std::string_view name, const checksum_options &options = {});
};

} // namespace checkdigit
