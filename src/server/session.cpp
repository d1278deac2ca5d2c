// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/write.hpp>

#include "http/response.hpp"
#include "log.hpp"
#include "server/session.hpp"
#include "utils.hpp"

namespace cardcheck {

namespace beast = boost::beast;
namespace beast_http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

bool is_protocol_error(const beast::error_code &ec)
{
    return ec.category() == beast_http::make_error_code(beast_http::error::bad_version).category();
}

std::string_view to_std(beast::string_view sv) { return {sv.data(), sv.size()}; }

} // namespace

session::session(tcp::socket &&socket, const http::router &routes, std::size_t body_limit,
    std::chrono::seconds idle_timeout)
    : stream_(std::move(socket)), routes_(routes), body_limit_(body_limit),
      idle_timeout_(idle_timeout)
{
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (ec) {
        remote_ = "?";
    } else {
        remote_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
}

void session::run()
{
    // Sessions are started from the acceptor, hop onto the stream executor
    boost::asio::dispatch(
        stream_.get_executor(), beast::bind_front_handler(&session::do_read, shared_from_this()));
}

void session::do_read()
{
    parser_.emplace();
    parser_->body_limit(body_limit_);

    stream_.expires_after(idle_timeout_);
    beast_http::async_read_header(stream_, buffer_, *parser_,
        beast::bind_front_handler(&session::on_read_header, shared_from_this()));
}

void session::on_read_header(beast::error_code ec, std::size_t /*bytes_transferred*/)
{
    if (ec) {
        on_read_error(ec);
        return;
    }

    const auto &req = parser_->get();
    if (string_iequals(to_std(req[beast_http::field::expect]), "100-continue")) {
        continue_ = {};
        continue_.version(req.version());
        continue_.result(beast_http::status::continue_);
        beast_http::async_write(stream_, continue_,
            beast::bind_front_handler(&session::on_continue_sent, shared_from_this()));
        return;
    }

    do_read_body();
}

void session::on_continue_sent(beast::error_code ec, std::size_t /*bytes_transferred*/)
{
    if (ec) {
        CARDCHECK_DEBUG("[{}] Failed to send 100-continue: {}", remote_, ec.message());
        return;
    }

    do_read_body();
}

void session::do_read_body()
{
    beast_http::async_read(stream_, buffer_, *parser_,
        beast::bind_front_handler(&session::on_read, shared_from_this()));
}

void session::on_read(beast::error_code ec, std::size_t /*bytes_transferred*/)
{
    if (ec) {
        on_read_error(ec);
        return;
    }

    auto req = parser_->release();
    ++request_count_;

    CARDCHECK_DEBUG("[{}] Request #{}: {} {} HTTP/{}.{}", remote_, request_count_,
        to_std(req.method_string()), to_std(req.target()), req.version() / 10,
        req.version() % 10);

    send(routes_.route(req));
}

void session::on_read_error(beast::error_code ec)
{
    if (ec == beast_http::error::end_of_stream) {
        do_close();
        return;
    }

    if (ec == beast::error::timeout) {
        // The stream has already closed the socket
        CARDCHECK_DEBUG("[{}] Idle timeout after {} requests", remote_, request_count_);
        return;
    }

    if (ec == beast_http::error::partial_message) {
        CARDCHECK_DEBUG("[{}] Connection closed mid-request", remote_);
        return;
    }

    http::response res;
    if (ec == beast_http::error::body_limit) {
        CARDCHECK_WARN("[{}] Request body exceeds {} bytes", remote_, body_limit_);
        res = http::make_error_response(
            beast_http::status::payload_too_large, "Request body too large");
    } else if (is_protocol_error(ec)) {
        CARDCHECK_WARN("[{}] Malformed request: {}", remote_, ec.message());
        res = http::make_error_response(beast_http::status::bad_request, "Bad Request");
    } else {
        CARDCHECK_DEBUG("[{}] Read failed: {}", remote_, ec.message());
        return;
    }

    res.keep_alive(false);
    res.prepare_payload();
    send(std::move(res));
}

void session::send(http::response &&res)
{
    res_ = std::move(res);
    const bool keep_alive = res_.keep_alive();

    stream_.expires_after(idle_timeout_);
    beast_http::async_write(stream_, res_,
        beast::bind_front_handler(&session::on_write, shared_from_this(), keep_alive));
}

void session::on_write(bool keep_alive, beast::error_code ec, std::size_t /*bytes_transferred*/)
{
    if (ec) {
        CARDCHECK_DEBUG("[{}] Write failed: {}", remote_, ec.message());
        return;
    }

    if (!keep_alive) {
        do_close();
        return;
    }

    do_read();
}

void session::do_close()
{
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec) {
        CARDCHECK_TRACE("[{}] Shutdown failed: {}", remote_, ec.message());
    }
}

} // namespace cardcheck
