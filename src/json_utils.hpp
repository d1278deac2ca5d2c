// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

namespace cardcheck {

struct card_number_input {
    std::string number;
};

struct validation_result {
    bool valid{false};
};

// Decodes the first JSON value in the body, anything after it is ignored.
// Throws parsing_error on malformed JSON or when the value can't be decoded
// into a card_number_input.
card_number_input json_to_card_number(std::string_view json);

// Throws serialization_error if the writer rejects the document.
std::string validation_result_to_json(const validation_result &result);

} // namespace cardcheck
