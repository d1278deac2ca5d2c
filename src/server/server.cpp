// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <csignal>
#include <cstdint>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>

#include "exception.hpp"
#include "log.hpp"
#include "server/server.hpp"
#include "server/session.hpp"

namespace cardcheck {

namespace beast = boost::beast;
namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;

server::server(server_config config, const http::router &routes)
    : config_(std::move(config)), routes_(routes), ioc_(static_cast<int>(config_.threads)),
      acceptor_(asio::make_strand(ioc_)), signals_(ioc_)
{
    beast::error_code ec;
    auto address = asio::ip::make_address(config_.address, ec);
    if (ec) {
        throw configuration_error("invalid listen address '" + config_.address + "'");
    }

    const tcp::endpoint endpoint{address, config_.port};
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);

    CARDCHECK_INFO("Listening on {}:{}", config_.address, port());
}

uint16_t server::port() const { return acceptor_.local_endpoint().port(); }

void server::run()
{
    do_accept();

    std::vector<std::thread> workers;
    workers.reserve(config_.threads - 1);
    for (unsigned i = 1; i < config_.threads; ++i) {
        workers.emplace_back([this] { ioc_.run(); });
    }

    CARDCHECK_DEBUG("Serving on {} threads", config_.threads);
    ioc_.run();

    for (auto &worker : workers) {
        worker.join();
    }
    CARDCHECK_INFO("Server stopped");
}

void server::stop()
{
    CARDCHECK_DEBUG("Stopping server");
    ioc_.stop();
}

void server::stop_on_signals()
{
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const beast::error_code &ec, int signo) {
        if (ec) {
            return;
        }
        CARDCHECK_INFO("Received signal {}, shutting down", signo);
        stop();
    });
}

void server::do_accept()
{
    // Each connection gets its own strand
    acceptor_.async_accept(
        asio::make_strand(ioc_), beast::bind_front_handler(&server::on_accept, this));
}

void server::on_accept(beast::error_code ec, tcp::socket socket)
{
    if (ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        CARDCHECK_WARN("Failed to accept connection: {}", ec.message());
    } else {
        std::make_shared<session>(
            std::move(socket), routes_, config_.body_limit, config_.idle_timeout)
            ->run();
    }

    do_accept();
}

} // namespace cardcheck
