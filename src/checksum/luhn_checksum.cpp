// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "checksum/luhn_checksum.hpp"
#include "exception.hpp"
#include "utils.hpp"

namespace cardcheck {

unsigned digit_value(char c, std::size_t position)
{
    if (!isdigit(c)) {
        throw invalid_input_error(c, position);
    }
    return static_cast<unsigned>(c - '0');
}

bool luhn_checksum::validate(std::string_view str) const
{
    // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    int64_t sum = 0;
    bool should_double = false;
    for (std::size_t i = str.size(); i > 0; --i) {
        const auto c = str[i - 1];

        int64_t d = 0;
        if (policy_ == input_policy::strict) {
            d = digit_value(c, i - 1);
        } else {
            // No digit check, e.g. ' ' yields -16
            d = static_cast<int64_t>(static_cast<unsigned char>(c)) - '0';
        }

        if (should_double) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }

        sum += d;
        should_double = !should_double;
    }

    return sum % 10 == 0;
    // NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
}

} // namespace cardcheck
