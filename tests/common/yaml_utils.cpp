// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>

#include "common/yaml_utils.hpp"

namespace YAML {

checkdigit::test::algorithm_fixture as_if<checkdigit::test::algorithm_fixture, void>::operator()()
    const
{
    if (!node.IsMap()) {
        throw parsing_error("fixture must be a map");
    }

    checkdigit::test::algorithm_fixture fixture;
    fixture.algorithm = node["algorithm"].as<std::string>();
    if (auto strict = node["strict"]; strict) {
        fixture.strict = strict.as<bool>();
    }

    if (auto valid = node["valid"]; valid) {
        if (!valid.IsSequence()) {
            throw parsing_error("valid cases must be a sequence");
        }

        for (const auto &entry : valid) {
            fixture.valid.push_back({entry["protected"].as<std::string>(),
                entry["unprotected"].as<std::string>(), entry["check"].as<std::string>()});
        }
    }

    if (auto invalid = node["invalid"]; invalid) {
        if (!invalid.IsSequence()) {
            throw parsing_error("invalid cases must be a sequence");
        }

        for (const auto &entry : invalid) { fixture.invalid.push_back(entry.as<std::string>()); }
    }

    return fixture;
}

} // namespace YAML
