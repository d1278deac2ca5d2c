// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>
#include <utility>

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

#include "exception.hpp"
#include "http/luhn_handler.hpp"
#include "http/response.hpp"
#include "json_utils.hpp"
#include "log.hpp"

namespace cardcheck::http {

namespace beast_http = boost::beast::http;

response luhn_handler::handle(const request &req) const
{
    if (req.method() != beast_http::verb::post) {
        const auto method = req.method_string();
        CARDCHECK_DEBUG("Rejecting method {}", std::string_view{method.data(), method.size()});
        return make_error_response(beast_http::status::method_not_allowed, "Invalid request method");
    }

    card_number_input input;
    try {
        input = json_to_card_number(req.body());
    } catch (const parsing_error &e) {
        CARDCHECK_DEBUG("Failed to decode payload: {}", e.what());
        return make_error_response(beast_http::status::bad_request, "Invalid JSON payload");
    }

    // The number itself is never logged, only its length
    validation_result result;
    try {
        result.valid = checksum_.validate(input.number);
    } catch (const invalid_input_error &e) {
        CARDCHECK_DEBUG("Rejecting card number of length {}: {}", input.number.size(), e.what());
        return make_error_response(beast_http::status::bad_request, "Invalid card number");
    }

    CARDCHECK_TRACE("Card number of length {} is {}", input.number.size(),
        result.valid ? "valid" : "invalid");

    std::string body;
    try {
        body = validation_result_to_json(result);
    } catch (const serialization_error &e) {
        CARDCHECK_ERROR("{}", e.what());
        return make_error_response(
            beast_http::status::internal_server_error, "Error creating response");
    }

    return make_json_response(std::move(body));
}

} // namespace cardcheck::http
