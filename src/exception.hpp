// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <utility>

namespace cardcheck {

class exception : public std::exception {
public:
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    explicit exception(std::string what) : what_(std::move(what)) {}

    std::string what_;
};

class parsing_error : public exception {
public:
    explicit parsing_error(std::string what) : exception(std::move(what)) {}
};

class invalid_input_error : public exception {
public:
    invalid_input_error(char c, std::size_t position)
        : exception("invalid character at position " + std::to_string(position)), c_(c),
          position_(position)
    {}

    [[nodiscard]] char character() const noexcept { return c_; }
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

protected:
    char c_;
    std::size_t position_;
};

class serialization_error : public exception {
public:
    explicit serialization_error(std::string what) : exception(std::move(what)) {}
};

class configuration_error : public exception {
public:
    explicit configuration_error(std::string what) : exception(std::move(what)) {}
};

} // namespace cardcheck
