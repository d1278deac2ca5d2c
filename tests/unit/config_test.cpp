// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <chrono>

#include <yaml-cpp/yaml.h>

#include "cardcheck.hpp"
#include "config.hpp"
#include "exception.hpp"

#include "common/gtest_utils.hpp"

using namespace cardcheck;
using namespace std::literals;

namespace {

TEST(TestConfig, Defaults)
{
    server_config config;
    EXPECT_STR(config.address, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.threads, 1U);
    EXPECT_EQ(config.body_limit, 1024U * 1024U);
    EXPECT_EQ(config.idle_timeout, 30s);
    EXPECT_EQ(config.policy, input_policy::unchecked);
    EXPECT_EQ(config.level, log_level::info);
}

TEST(TestConfig, EmptyDocument)
{
    auto config = config_from_yaml(YAML::Load(""));
    EXPECT_STR(config.address, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);

    config = config_from_yaml(YAML::Load("{}"));
    EXPECT_EQ(config.threads, 1U);
}

TEST(TestConfig, FullDocument)
{
    auto config = config_from_yaml(YAML::Load(R"(
server:
  address: 127.0.0.1
  port: 9090
  threads: 4
  body_limit: 4096
  idle_timeout: 5
validation:
  input_policy: strict
log_level: debug
)"));

    EXPECT_STR(config.address, "127.0.0.1");
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.threads, 4U);
    EXPECT_EQ(config.body_limit, 4096U);
    EXPECT_EQ(config.idle_timeout, 5s);
    EXPECT_EQ(config.policy, input_policy::strict);
    EXPECT_EQ(config.level, log_level::debug);
}

TEST(TestConfig, PartialDocumentKeepsBase)
{
    server_config base;
    base.port = 1234;
    base.policy = input_policy::strict;

    auto config = config_from_yaml(YAML::Load("server: {threads: 2}\nlog_level: warn"), base);
    EXPECT_EQ(config.port, 1234);
    EXPECT_EQ(config.threads, 2U);
    EXPECT_EQ(config.policy, input_policy::strict);
    EXPECT_EQ(config.level, log_level::warn);
}

TEST(TestConfig, NullValuesKeepBase)
{
    auto config = config_from_yaml(YAML::Load("server:\n  port: ~\nvalidation: ~\n"));
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.policy, input_policy::unchecked);
}

TEST(TestConfig, InputPolicyFromString)
{
    EXPECT_EQ(input_policy_from_str("strict"), input_policy::strict);
    EXPECT_EQ(input_policy_from_str("unchecked"), input_policy::unchecked);
    EXPECT_THROW(input_policy_from_str("Strict"), configuration_error);
    EXPECT_THROW(input_policy_from_str(""), configuration_error);
}

TEST(TestConfig, InvalidValues)
{
    EXPECT_THROW(config_from_yaml(YAML::Load("server: {port: http}")), configuration_error);
    EXPECT_THROW(config_from_yaml(YAML::Load("server: {threads: many}")), configuration_error);
    EXPECT_THROW(config_from_yaml(YAML::Load("server: {threads: 0}")), configuration_error);
    EXPECT_THROW(config_from_yaml(YAML::Load("server: {body_limit: 0}")), configuration_error);
    EXPECT_THROW(config_from_yaml(YAML::Load("server: {idle_timeout: 0}")), configuration_error);
    EXPECT_THROW(
        config_from_yaml(YAML::Load("validation: {input_policy: lenient}")), configuration_error);
    EXPECT_THROW(config_from_yaml(YAML::Load("log_level: verbose")), configuration_error);
}

TEST(TestConfig, InvalidStructure)
{
    EXPECT_THROW(config_from_yaml(YAML::Load("[1, 2]")), configuration_error);
    EXPECT_THROW(config_from_yaml(YAML::Load("8080")), configuration_error);
    EXPECT_THROW(config_from_yaml(YAML::Load("server: 8080")), configuration_error);
    EXPECT_THROW(config_from_yaml(YAML::Load("validation: [strict]")), configuration_error);
}

TEST(TestConfig, MissingFile)
{
    EXPECT_THROW(load_config("/nonexistent/cardcheck.yaml"), configuration_error);
}

} // namespace
