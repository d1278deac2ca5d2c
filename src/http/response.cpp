// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>
#include <utility>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>

#include "http/response.hpp"

namespace cardcheck::http {

response make_error_response(boost::beast::http::status status, std::string_view message)
{
    response res{status, 11};
    res.set(boost::beast::http::field::content_type, std::string{text_content_type});
    res.set("X-Content-Type-Options", "nosniff");

    std::string body;
    body.reserve(message.size() + 1);
    body.append(message);
    body.push_back('\n');
    res.body() = std::move(body);
    return res;
}

response make_json_response(std::string body)
{
    response res{boost::beast::http::status::ok, 11};
    res.set(boost::beast::http::field::content_type, std::string{json_content_type});
    res.body() = std::move(body);
    return res;
}

} // namespace cardcheck::http
