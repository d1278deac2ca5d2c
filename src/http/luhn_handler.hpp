// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include "cardcheck.hpp"
#include "checksum/luhn_checksum.hpp"
#include "http/handler.hpp"

namespace cardcheck::http {

// POST {"number": "<digits>"} -> 200 {"valid": <bool>}
class luhn_handler : public base_handler {
public:
    explicit luhn_handler(input_policy policy = input_policy::unchecked) : checksum_(policy) {}
    luhn_handler(const luhn_handler &) = default;
    luhn_handler &operator=(const luhn_handler &) = default;
    luhn_handler(luhn_handler &&) = default;
    luhn_handler &operator=(luhn_handler &&) = default;
    ~luhn_handler() override = default;

    [[nodiscard]] response handle(const request &req) const override;

protected:
    luhn_checksum checksum_;
};

} // namespace cardcheck::http
