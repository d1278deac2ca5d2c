// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <functional>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "cardcheck.hpp"
#include "common/utils.hpp"
#include "exception.hpp"
#include "log.hpp"

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
arg_map parse_args(int argc, char *argv[], const arg_mapping &mapping,
    const std::set<std::string, std::less<>> &flags, std::vector<std::string> *positional)
{
    arg_map args;
    auto last_arg = args.end();
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.starts_with('-')) {
            if (auto long_arg = mapping.find(arg); long_arg != mapping.end()) {
                arg = long_arg->second;
            } else {
                continue; // Unknown option
            }

            auto [it, res] = args.emplace(arg, std::vector<std::string>{});
            last_arg = flags.contains(arg) ? args.end() : it;
        } else if (last_arg != args.end()) {
            last_arg->second.emplace_back(arg);
            last_arg = args.end();
        } else if (positional != nullptr) {
            positional->emplace_back(arg);
        }
    }
    return args;
}

void log_cb(cardcheck::log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    fmt::print(stderr, "[{}][{}:{}:{}]: {}\n", cardcheck::log_level_to_str(level), file, function,
        line, message);
}

bool check_numbers(
    const std::vector<std::string> &numbers, cardcheck::input_policy policy, std::ostream &out)
{
    bool all_valid = true;
    for (const auto &number : numbers) {
        try {
            const bool valid = cardcheck::is_valid_luhn(number, policy);
            out << number << ": " << (valid ? "valid" : "invalid") << '\n';
            all_valid = all_valid && valid;
        } catch (const cardcheck::invalid_input_error &e) {
            out << number << ": rejected (" << e.what() << ")\n";
            all_valid = false;
        }
    }
    return all_valid;
}
