// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cardcheck.hpp"
#include "log.hpp"

using arg_map = std::unordered_map<std::string, std::vector<std::string>>;

using arg_mapping = std::map<std::string, std::string, std::less<>>;

// Options are normalised through the mapping (short to long). Options take a
// single value unless they are listed as flags, remaining arguments are
// appended to positional. Unknown options are ignored.
// NOLINTNEXTLINE(modernize-avoid-c-arrays)
arg_map parse_args(int argc, char *argv[], const arg_mapping &mapping,
    const std::set<std::string, std::less<>> &flags = {},
    std::vector<std::string> *positional = nullptr);

void log_cb(cardcheck::log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);

// Writes "<number>: valid|invalid|rejected (...)" per number, returns whether
// every number is valid.
bool check_numbers(
    const std::vector<std::string> &numbers, cardcheck::input_policy policy, std::ostream &out);
