// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "cardcheck.hpp"
#include "common/utils.hpp"

int main(int argc, char *argv[])
{
    const arg_mapping mapping{{"-s", "--strict"}, {"--strict", "--strict"}};

    std::vector<std::string> numbers;
    auto args = parse_args(argc, argv, mapping, {"--strict"}, &numbers);

    if (numbers.empty()) {
        std::cout << "Usage: " << argv[0] << " [--strict] <number> [<number>..]\n";
        return EXIT_FAILURE;
    }

    const auto policy = args.contains("--strict") ? cardcheck::input_policy::strict
                                                  : cardcheck::input_policy::unchecked;

    return check_numbers(numbers, policy, std::cout) ? EXIT_SUCCESS : EXIT_FAILURE;
}
