// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <optional>
#include <string_view>

#include "log.hpp"

using namespace std::literals;

namespace cardcheck {

logger::log_cb_type logger::cb = nullptr;
log_level logger::min_level = log_level::off;

void logger::init(log_cb_type cb, log_level min_level)
{
    logger::cb = cb;
    logger::min_level = min_level;
}

void logger::log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, size_t length)
{
    logger::cb(level, function, file, line, message, length);
}

std::optional<log_level> log_level_from_str(std::string_view str)
{
    if (str == "trace"sv || str == "TRACE"sv) {
        return log_level::trace;
    }

    if (str == "debug"sv || str == "DEBUG"sv) {
        return log_level::debug;
    }

    if (str == "info"sv || str == "INFO"sv) {
        return log_level::info;
    }

    if (str == "warn"sv || str == "WARN"sv) {
        return log_level::warn;
    }

    if (str == "error"sv || str == "ERROR"sv) {
        return log_level::error;
    }

    if (str == "off"sv || str == "OFF"sv) {
        return log_level::off;
    }

    return std::nullopt;
}

} // namespace cardcheck
