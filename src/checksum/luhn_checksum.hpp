// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string_view>

#include "cardcheck.hpp"

namespace cardcheck {

// Numeric value of a decimal digit character, throws invalid_input_error
// on anything outside of '0'..'9'.
unsigned digit_value(char c, std::size_t position);

class luhn_checksum {
public:
    explicit luhn_checksum(input_policy policy = input_policy::unchecked) : policy_(policy) {}
    luhn_checksum(const luhn_checksum &) = default;
    luhn_checksum &operator=(const luhn_checksum &) = default;
    luhn_checksum(luhn_checksum &&) = default;
    luhn_checksum &operator=(luhn_checksum &&) = default;
    ~luhn_checksum() = default;

    // With input_policy::unchecked every character contributes its code minus
    // '0' to the sum, so the result is only meaningful for digit strings.
    [[nodiscard]] bool validate(std::string_view str) const;

    [[nodiscard]] input_policy policy() const noexcept { return policy_; }

protected:
    input_policy policy_;
};

} // namespace cardcheck
