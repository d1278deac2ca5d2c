// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/core/error.hpp>

#include "config.hpp"
#include "http/router.hpp"

namespace cardcheck {

class server {
public:
    // Binds and listens immediately, port 0 picks an ephemeral port.
    // The router must outlive the server.
    server(server_config config, const http::router &routes);
    server(const server &) = delete;
    server &operator=(const server &) = delete;
    server(server &&) = delete;
    server &operator=(server &&) = delete;
    ~server() = default;

    // Serves on config.threads threads, the calling one included, until
    // stop() is called or a registered signal is received.
    void run();

    // Thread-safe
    void stop();

    // Stop on SIGINT and SIGTERM, must be called before run()
    void stop_on_signals();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] const server_config &config() const noexcept { return config_; }

protected:
    void do_accept();
    void on_accept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    server_config config_;
    const http::router &routes_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
};

} // namespace cardcheck
