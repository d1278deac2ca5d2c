// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string_view>

#include "cardcheck.hpp"
#include "checksum/luhn_checksum.hpp"

namespace cardcheck {

bool is_valid_luhn(std::string_view number, input_policy policy)
{
    return luhn_checksum{policy}.validate(number);
}

const char *get_version() { return CARDCHECK_VERSION; }

} // namespace cardcheck
