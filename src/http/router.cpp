// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

#include "http/response.hpp"
#include "http/router.hpp"
#include "log.hpp"

namespace cardcheck::http {

namespace beast_http = boost::beast::http;

std::string_view target_path(std::string_view target)
{
    auto end = target.find_first_of("?#");
    if (end != std::string_view::npos) {
        target = target.substr(0, end);
    }
    return target;
}

router &router::add(std::string path, std::unique_ptr<base_handler> handler)
{
    if (!handler) {
        throw std::invalid_argument("null handler for path " + path);
    }

    CARDCHECK_DEBUG("Registering handler for {}", path);
    routes_.insert_or_assign(std::move(path), std::move(handler));
    return *this;
}

const base_handler *router::find(std::string_view path) const
{
    auto it = routes_.find(std::string{path});
    if (it == routes_.end()) {
        return nullptr;
    }
    return it->second.get();
}

response router::route(const request &req) const
{
    const auto target = req.target();
    const auto path = target_path({target.data(), target.size()});

    response res;
    const auto *handler = find(path);
    if (handler == nullptr) {
        CARDCHECK_DEBUG("No handler for {}", path);
        res = make_error_response(beast_http::status::not_found, "404 page not found");
    } else {
        try {
            res = handler->handle(req);
        } catch (const std::exception &e) {
            CARDCHECK_ERROR("Handler for {} failed: {}", path, e.what());
            res = make_error_response(
                beast_http::status::internal_server_error, "Internal Server Error");
        }
    }

    res.version(req.version());
    res.keep_alive(req.keep_alive());
    res.prepare_payload();

    // HEAD replies carry the headers of the full response but no body
    if (req.method() == beast_http::verb::head) {
        res.body().clear();
    }
    return res;
}

} // namespace cardcheck::http
