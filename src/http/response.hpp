// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include <boost/beast/http/status.hpp>

#include "http/handler.hpp"

namespace cardcheck::http {

constexpr std::string_view text_content_type = "text/plain; charset=utf-8";
constexpr std::string_view json_content_type = "application/json";

// Plain text error reply, the message is terminated by a newline
response make_error_response(boost::beast::http::status status, std::string_view message);

response make_json_response(std::string body);

} // namespace cardcheck::http
