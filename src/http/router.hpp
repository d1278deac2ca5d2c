// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "http/handler.hpp"

namespace cardcheck::http {

// Exact path to handler mapping. The query string is not part of the path.
class router {
public:
    router() = default;
    router(const router &) = delete;
    router &operator=(const router &) = delete;
    router(router &&) = default;
    router &operator=(router &&) = default;
    ~router() = default;

    // Replaces any handler previously registered for the path
    router &add(std::string path, std::unique_ptr<base_handler> handler);

    [[nodiscard]] const base_handler *find(std::string_view path) const;

    // Never throws on handler failure: unknown paths map to 404 and handler
    // exceptions to 500.
    [[nodiscard]] response route(const request &req) const;

    [[nodiscard]] std::size_t size() const noexcept { return routes_.size(); }

protected:
    std::unordered_map<std::string, std::unique_ptr<base_handler>> routes_;
};

// Path component of a request target, e.g. "/" for "/?debug=1"
std::string_view target_path(std::string_view target);

} // namespace cardcheck::http
