// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "cardcheck.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "log.hpp"

using namespace std::literals;

namespace cardcheck {

namespace {

template <typename T> T at(const YAML::Node &node, const std::string &key, const T &default_)
{
    const auto value = node[key];
    if (!value.IsDefined() || value.IsNull()) {
        return default_;
    }

    try {
        return value.as<T>();
    } catch (const YAML::Exception &e) {
        throw configuration_error("invalid type for key '" + key + "': " + e.msg);
    }
}

YAML::Node section(const YAML::Node &node, const std::string &key)
{
    const auto value = node[key];
    if (value.IsDefined() && !value.IsNull() && !value.IsMap()) {
        throw configuration_error("'" + key + "' must be a map");
    }
    return value;
}

} // namespace

input_policy input_policy_from_str(std::string_view str)
{
    if (str == "unchecked"sv) {
        return input_policy::unchecked;
    }

    if (str == "strict"sv) {
        return input_policy::strict;
    }

    throw configuration_error("unknown input policy '" + std::string{str} + "'");
}

server_config config_from_yaml(const YAML::Node &node, server_config base)
{
    if (!node.IsDefined() || node.IsNull()) {
        return base;
    }

    if (!node.IsMap()) {
        throw configuration_error("configuration root must be a map");
    }

    auto server = section(node, "server");
    if (server.IsMap()) {
        base.address = at<std::string>(server, "address", base.address);
        base.port = at<uint16_t>(server, "port", base.port);
        base.threads = at<unsigned>(server, "threads", base.threads);
        base.body_limit = at<std::size_t>(server, "body_limit", base.body_limit);
        base.idle_timeout = std::chrono::seconds{
            at<unsigned>(server, "idle_timeout", static_cast<unsigned>(base.idle_timeout.count()))};
    }

    auto validation = section(node, "validation");
    if (validation.IsMap()) {
        auto policy = at<std::string>(validation, "input_policy", {});
        if (!policy.empty()) {
            base.policy = input_policy_from_str(policy);
        }
    }

    auto level_str = at<std::string>(node, "log_level", {});
    if (!level_str.empty()) {
        auto level = log_level_from_str(level_str);
        if (!level) {
            throw configuration_error("unknown log level '" + level_str + "'");
        }
        base.level = *level;
    }

    if (base.threads == 0) {
        throw configuration_error("'threads' must be at least 1");
    }

    if (base.body_limit == 0) {
        throw configuration_error("'body_limit' must be greater than 0");
    }

    if (base.idle_timeout.count() == 0) {
        throw configuration_error("'idle_timeout' must be greater than 0");
    }

    return base;
}

server_config load_config(std::string_view path, server_config base)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string{path});
    } catch (const YAML::Exception &e) {
        throw configuration_error("failed to load '" + std::string{path} + "': " + e.what());
    }

    CARDCHECK_DEBUG("Loaded configuration from {}", path);
    return config_from_yaml(root, std::move(base));
}

} // namespace cardcheck
