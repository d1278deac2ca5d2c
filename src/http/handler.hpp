// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace cardcheck::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using response = boost::beast::http::response<boost::beast::http::string_body>;

class base_handler {
public:
    base_handler() = default;
    base_handler(const base_handler &) = default;
    base_handler &operator=(const base_handler &) = default;
    base_handler(base_handler &&) = default;
    base_handler &operator=(base_handler &&) = default;
    virtual ~base_handler() = default;

    // Called concurrently from every worker thread, implementations must not
    // hold mutable state. Version, keep-alive and payload size of the returned
    // response are filled in by the router.
    [[nodiscard]] virtual response handle(const request &req) const = 0;
};

} // namespace cardcheck::http
