// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>

#include "http/handler.hpp"
#include "http/router.hpp"

namespace cardcheck {

// One HTTP/1.1 connection. Requests are read and answered one at a time
// until the client closes, asks to close, or stays idle past the timeout.
class session : public std::enable_shared_from_this<session> {
public:
    session(boost::asio::ip::tcp::socket &&socket, const http::router &routes,
        std::size_t body_limit, std::chrono::seconds idle_timeout);
    session(const session &) = delete;
    session &operator=(const session &) = delete;
    session(session &&) = delete;
    session &operator=(session &&) = delete;
    ~session() = default;

    void run();

protected:
    void do_read();
    void on_read_header(boost::beast::error_code ec, std::size_t bytes_transferred);
    void on_continue_sent(boost::beast::error_code ec, std::size_t bytes_transferred);
    void do_read_body();
    void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
    void on_read_error(boost::beast::error_code ec);
    void send(http::response &&res);
    void on_write(bool keep_alive, boost::beast::error_code ec, std::size_t bytes_transferred);
    void do_close();

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
    boost::beast::http::response<boost::beast::http::empty_body> continue_;
    http::response res_;

    const http::router &routes_;
    std::size_t body_limit_;
    std::chrono::seconds idle_timeout_;
    std::string remote_;
    unsigned request_count_{0};
};

} // namespace cardcheck
