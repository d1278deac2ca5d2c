// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <cstdlib>
#include <string>

#include <fmt/core.h>

#include "log.hpp"

#include "common/gtest_utils.hpp"

using namespace std::literals;

namespace {

void log_cb(cardcheck::log_level level, const char *function, const char *file, unsigned line,
    const char *message, [[maybe_unused]] uint64_t len)
{
    fmt::print("[{}][{}:{}:{}]: {}\n", cardcheck::log_level_to_str(level), file, function, line,
        message);
}

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
cardcheck::log_level find_log_level(int argc, char *argv[])
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    auto *env_level = getenv("CARDCHECK_TEST_LOG_LEVEL");
    if (env_level != nullptr) {
        return cardcheck::log_level_from_str(env_level).value_or(cardcheck::log_level::off);
    }

    cardcheck::log_level level = cardcheck::log_level::trace;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log_level" || arg == "--log-level") {
            if (i + 1 < argc) {
                level = cardcheck::log_level_from_str(argv[i + 1]).value_or(
                    cardcheck::log_level::off);
            }
            break;
        }
    }
    return level;
}

} // namespace

int main(int argc, char *argv[])
{
    cardcheck::logger::init(log_cb, find_log_level(argc, argv));

    testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
