// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include <fmt/core.h> // IWYU pragma: keep

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// Strips the directories from __FILE__ at compile time
constexpr const char *base_name(const char *path)
{
    const char *base = path;
    while (*path != '\0') {
        const char separator = '/';
        if (*path++ == separator) {
            base = path;
        }
    }
    return base;
}

// Formatting only happens when the level is enabled. A record that fails to
// format is dropped, logging never throws into the caller.
#define CARDCHECK_LOG_HELPER(level, function, file, line, fmt_str, ...)                            \
    {                                                                                              \
        if (cardcheck::logger::valid(level)) {                                                     \
            try {                                                                                  \
                constexpr const char *filename = base_name(file);                                  \
                auto message = fmt::format(fmt_str, ##__VA_ARGS__);                                \
                cardcheck::logger::log(                                                            \
                    level, function, filename, line, message.c_str(), message.size());             \
            } catch (...) {}                                                                       \
        }                                                                                          \
    }

#define CARDCHECK_LOG(level, fmt, ...)                                                             \
    CARDCHECK_LOG_HELPER(level, __func__, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define CARDCHECK_TRACE(fmt, ...) CARDCHECK_LOG(cardcheck::log_level::trace, fmt, ##__VA_ARGS__)
#define CARDCHECK_DEBUG(fmt, ...) CARDCHECK_LOG(cardcheck::log_level::debug, fmt, ##__VA_ARGS__)
#define CARDCHECK_INFO(fmt, ...) CARDCHECK_LOG(cardcheck::log_level::info, fmt, ##__VA_ARGS__)
#define CARDCHECK_WARN(fmt, ...) CARDCHECK_LOG(cardcheck::log_level::warn, fmt, ##__VA_ARGS__)
#define CARDCHECK_ERROR(fmt, ...) CARDCHECK_LOG(cardcheck::log_level::error, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace cardcheck {

enum class log_level : uint8_t { trace, debug, info, warn, error, off };

inline std::string_view log_level_to_str(log_level level)
{
    switch (level) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::error:
        return "error";
    case log_level::warn:
        return "warn";
    case log_level::info:
        return "info";
    case log_level::off:
        break;
    }

    return "off";
}

// Accepts lowercase and uppercase names, nullopt on anything else
std::optional<log_level> log_level_from_str(std::string_view str);

class logger {
public:
    using log_cb_type = void (*)(log_level level, const char *function, const char *file,
        unsigned line, const char *message, uint64_t message_len);

    static void init(log_cb_type cb, log_level min_level);
    static bool valid(log_level level) { return cb != nullptr && level >= min_level; }
    static void log(log_level level, const char *function, const char *file, unsigned line,
        const char *message, size_t length);

private:
    static log_cb_type cb;
    static log_level min_level;
};

} // namespace cardcheck
