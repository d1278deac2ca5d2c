// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/error/error.h>
#include <rapidjson/rapidjson.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>
#include <string_view>

#include "exception.hpp"
#include "json_utils.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace cardcheck {

namespace {

constexpr std::string_view number_key = "number";

} // namespace

card_number_input json_to_card_number(std::string_view json)
{
    rapidjson::Document doc;
    const rapidjson::ParseResult result =
        doc.Parse<rapidjson::kParseStopWhenDoneFlag>(json.data(), json.size());
    if (result.IsError()) {
        throw parsing_error(std::string{"malformed json: "} +
                            rapidjson::GetParseError_En(result.Code()) + " at offset " +
                            std::to_string(result.Offset()));
    }

    card_number_input input;
    if (doc.IsNull()) {
        return input;
    }

    if (!doc.IsObject()) {
        throw parsing_error("expected a json object");
    }

    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        const std::string_view key{it->name.GetString(), it->name.GetStringLength()};
        if (!string_iequals(key, number_key)) {
            CARDCHECK_TRACE("Ignoring unknown field '{}'", key);
            continue;
        }

        const auto &value = it->value;
        if (value.IsString()) {
            input.number.assign(value.GetString(), value.GetStringLength());
        } else if (!value.IsNull()) {
            throw parsing_error("invalid type for field 'number', expected string");
        }
    }

    return input;
}

std::string validation_result_to_json(const validation_result &result)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    if (!writer.StartObject() || !writer.Key("valid") || !writer.Bool(result.valid) ||
        !writer.EndObject() || !writer.IsComplete()) {
        throw serialization_error("failed to serialize validation result");
    }

    return {buffer.GetString(), buffer.GetSize()};
}

} // namespace cardcheck
