// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef CARDCHECK_HPP
#define CARDCHECK_HPP

#include <cstdint>
#include <string_view>

#define CARDCHECK_VERSION_MAJOR 1
#define CARDCHECK_VERSION_MINOR 0
#define CARDCHECK_VERSION_PATCH 0
#define CARDCHECK_VERSION "1.0.0"

namespace cardcheck {

/**
 * @enum input_policy
 *
 * How the checksum treats characters outside of '0'..'9'.
 **/
enum class input_policy : uint8_t {
    // Non-digits are converted by raw character arithmetic and take part in the sum
    unchecked,
    // Non-digits raise cardcheck::invalid_input_error before any sum is computed
    strict,
};

/**
 * is_valid_luhn
 *
 * Verifies the Luhn checksum of the provided number.
 *
 * @param number Sequence of decimal digits, rightmost being the check digit.
 * @param policy Treatment of non-digit characters.
 *
 * @return Whether the running total is a multiple of 10. An empty number is
 *         reported as valid.
 *
 * @throws cardcheck::invalid_input_error with input_policy::strict when the
 *         number contains a non-digit character.
 **/
bool is_valid_luhn(std::string_view number, input_policy policy = input_policy::unchecked);

/**
 * get_version
 *
 * Return the version of the library
 *
 * @return version Version string, null-terminated
 **/
const char *get_version();

} // namespace cardcheck

#endif /*CARDCHECK_HPP */
