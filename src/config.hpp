// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "cardcheck.hpp"
#include "log.hpp"

namespace cardcheck {

struct server_config {
    static constexpr uint16_t default_port = 8080;
    static constexpr std::size_t default_body_limit = 1024 * 1024;
    static constexpr std::chrono::seconds default_idle_timeout{30};

    std::string address{"0.0.0.0"};
    uint16_t port{default_port};
    unsigned threads{1};
    std::size_t body_limit{default_body_limit};
    std::chrono::seconds idle_timeout{default_idle_timeout};
    input_policy policy{input_policy::unchecked};
    log_level level{log_level::info};
};

// Overrides the fields of base present in the node, e.g.
//
//   server:
//     address: 127.0.0.1
//     port: 8080
//     threads: 4
//     body_limit: 1048576
//     idle_timeout: 30
//   validation:
//     input_policy: strict
//   log_level: debug
//
// Throws configuration_error on unknown values or wrong types.
server_config config_from_yaml(const YAML::Node &node, server_config base = {});

server_config load_config(std::string_view path, server_config base = {});

input_policy input_policy_from_str(std::string_view str);

} // namespace cardcheck
