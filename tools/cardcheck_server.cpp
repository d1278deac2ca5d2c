// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cardcheck.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "http/luhn_handler.hpp"
#include "http/router.hpp"
#include "log.hpp"
#include "server/server.hpp"
#include "utils.hpp"

using namespace cardcheck;

namespace {

void usage(const char *name)
{
    std::cout << "Usage: " << name
              << " [--config <yaml file>] [--address <ip>] [--port <port>]"
              << " [--threads <n>] [--strict] [--log-level <level>]\n";
}

const std::string &single_value(const arg_map &args, const std::string &option)
{
    const auto &values = args.at(option);
    if (values.empty()) {
        throw configuration_error("missing value for " + option);
    }
    return values.front();
}

// Command line options take precedence over the configuration file
server_config build_config(const arg_map &args)
{
    server_config config;
    if (args.contains("--config")) {
        config = load_config(single_value(args, "--config"), config);
    }

    if (args.contains("--address")) {
        config.address = single_value(args, "--address");
    }

    if (args.contains("--port")) {
        const auto &value = single_value(args, "--port");
        auto [res, port] = from_string<uint16_t>(value);
        if (!res) {
            throw configuration_error("invalid port '" + value + "'");
        }
        config.port = port;
    }

    if (args.contains("--threads")) {
        const auto &value = single_value(args, "--threads");
        auto [res, threads] = from_string<unsigned>(value);
        if (!res || threads == 0) {
            throw configuration_error("invalid thread count '" + value + "'");
        }
        config.threads = threads;
    }

    if (args.contains("--strict")) {
        config.policy = input_policy::strict;
    }

    if (args.contains("--log-level")) {
        const auto &value = single_value(args, "--log-level");
        auto level = log_level_from_str(value);
        if (!level) {
            throw configuration_error("unknown log level '" + value + "'");
        }
        config.level = *level;
    }

    return config;
}

} // namespace

int main(int argc, char *argv[])
{
    const arg_mapping mapping{{"-c", "--config"}, {"--config", "--config"}, {"-a", "--address"},
        {"--address", "--address"}, {"-p", "--port"}, {"--port", "--port"}, {"-t", "--threads"},
        {"--threads", "--threads"}, {"-s", "--strict"}, {"--strict", "--strict"},
        {"-l", "--log-level"}, {"--log-level", "--log-level"}, {"-h", "--help"},
        {"--help", "--help"}};

    auto args = parse_args(argc, argv, mapping, {"--strict", "--help"});
    if (args.contains("--help")) {
        usage(argv[0]);
        return EXIT_SUCCESS;
    }

    server_config config;
    try {
        config = build_config(args);
    } catch (const std::exception &e) {
        std::cerr << "Invalid configuration: " << e.what() << '\n';
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    logger::init(log_cb, config.level);
    CARDCHECK_INFO("cardcheck {} starting, input policy {}", get_version(),
        config.policy == input_policy::strict ? "strict" : "unchecked");

    http::router routes;
    routes.add("/", std::make_unique<http::luhn_handler>(config.policy));

    try {
        server srv{config, routes};
        srv.stop_on_signals();
        srv.run();
    } catch (const std::exception &e) {
        CARDCHECK_ERROR("{}", e.what());
        std::cerr << "Failed to start server: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
