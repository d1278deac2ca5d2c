// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.
#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <utility>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>

#include "http/handler.hpp"

#define EXPECT_STR(a, b) EXPECT_EQ(std::string_view{a}, std::string_view{b})

namespace cardcheck::test {

inline http::request make_request(
    boost::beast::http::verb method, std::string target, std::string body = {})
{
    http::request req{method, std::move(target), 11};
    req.set(boost::beast::http::field::content_type, "application/json");
    req.body() = std::move(body);
    req.prepare_payload();
    return req;
}

inline std::string_view header(const http::response &res, boost::beast::http::field field)
{
    auto value = res[field];
    return {value.data(), value.size()};
}

inline std::string_view header(const http::response &res, std::string_view name)
{
    auto value = res[boost::beast::string_view{name.data(), name.size()}];
    return {value.data(), value.size()};
}

} // namespace cardcheck::test
