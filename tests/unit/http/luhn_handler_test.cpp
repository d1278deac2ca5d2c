// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

#include "cardcheck.hpp"
#include "http/luhn_handler.hpp"

#include "common/gtest_utils.hpp"

using namespace cardcheck;
using namespace cardcheck::http;
using namespace cardcheck::test;

namespace beast_http = boost::beast::http;

namespace {

TEST(TestLuhnHandler, ValidNumber)
{
    luhn_handler handler;
    auto res = handler.handle(
        make_request(beast_http::verb::post, "/", R"({"number": "4003600000000014"})"));

    EXPECT_EQ(res.result(), beast_http::status::ok);
    EXPECT_STR(header(res, beast_http::field::content_type), "application/json");
    EXPECT_STR(res.body(), R"({"valid":true})");
}

TEST(TestLuhnHandler, InvalidNumber)
{
    luhn_handler handler;
    auto res = handler.handle(
        make_request(beast_http::verb::post, "/", R"({"number": "4003600000000015"})"));

    // A failed checksum is a result, not an error
    EXPECT_EQ(res.result(), beast_http::status::ok);
    EXPECT_STR(header(res, beast_http::field::content_type), "application/json");
    EXPECT_STR(res.body(), R"({"valid":false})");
}

TEST(TestLuhnHandler, EmptyNumber)
{
    luhn_handler handler;
    {
        auto res = handler.handle(make_request(beast_http::verb::post, "/", R"({"number": ""})"));
        EXPECT_EQ(res.result(), beast_http::status::ok);
        EXPECT_STR(res.body(), R"({"valid":true})");
    }

    {
        auto res = handler.handle(make_request(beast_http::verb::post, "/", "{}"));
        EXPECT_EQ(res.result(), beast_http::status::ok);
        EXPECT_STR(res.body(), R"({"valid":true})");
    }
}

TEST(TestLuhnHandler, MethodNotAllowed)
{
    luhn_handler handler;
    for (auto method : {beast_http::verb::get, beast_http::verb::put, beast_http::verb::delete_,
             beast_http::verb::head, beast_http::verb::options, beast_http::verb::patch}) {
        auto res = handler.handle(
            make_request(method, "/", R"({"number": "4003600000000014"})"));

        EXPECT_EQ(res.result(), beast_http::status::method_not_allowed);
        EXPECT_STR(header(res, beast_http::field::content_type), "text/plain; charset=utf-8");
        EXPECT_STR(header(res, "X-Content-Type-Options"), "nosniff");
        EXPECT_STR(res.body(), "Invalid request method\n");
    }
}

TEST(TestLuhnHandler, MalformedJson)
{
    luhn_handler handler;
    for (const auto *body : {"not json", "", R"({"number": 4003600000000014})",
             R"(["4003600000000014"])", R"({"number": "4003600000000014")"}) {
        auto res = handler.handle(make_request(beast_http::verb::post, "/", body));

        EXPECT_EQ(res.result(), beast_http::status::bad_request) << body;
        EXPECT_STR(header(res, beast_http::field::content_type), "text/plain; charset=utf-8");
        EXPECT_STR(res.body(), "Invalid JSON payload\n");
    }
}

TEST(TestLuhnHandler, UncheckedNonDigits)
{
    luhn_handler handler;
    auto res = handler.handle(
        make_request(beast_http::verb::post, "/", R"({"number": "4003-6000-0000-0014"})"));

    EXPECT_EQ(res.result(), beast_http::status::ok);
    EXPECT_STR(res.body(), R"({"valid":false})");
}

TEST(TestLuhnHandler, StrictNonDigits)
{
    luhn_handler handler{input_policy::strict};
    {
        auto res = handler.handle(
            make_request(beast_http::verb::post, "/", R"({"number": "4003-6000-0000-0014"})"));

        EXPECT_EQ(res.result(), beast_http::status::bad_request);
        EXPECT_STR(header(res, beast_http::field::content_type), "text/plain; charset=utf-8");
        EXPECT_STR(res.body(), "Invalid card number\n");
    }

    {
        auto res = handler.handle(
            make_request(beast_http::verb::post, "/", R"({"number": "4003600000000014"})"));
        EXPECT_EQ(res.result(), beast_http::status::ok);
        EXPECT_STR(res.body(), R"({"valid":true})");
    }
}

TEST(TestLuhnHandler, Idempotent)
{
    luhn_handler handler;
    auto req = make_request(beast_http::verb::post, "/", R"({"number": "4003600000000014"})");

    auto first = handler.handle(req);
    for (unsigned i = 0; i < 16; ++i) {
        auto res = handler.handle(req);
        EXPECT_EQ(res.result(), first.result());
        EXPECT_EQ(res.body(), first.body());
    }
}

} // namespace
