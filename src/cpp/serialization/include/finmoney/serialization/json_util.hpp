/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "finmoney/decimal/decimal.hpp"

#include <rapidjson/document.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace finmoney::json
{

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 4;
};

struct FormatOptions
{
    std::optional<IndentOptions> indent = {};
};

[[nodiscard]] std::string json2str(
    const rapidjson::Value& json, const FormatOptions& formatOptions = {});

/**
 * Reads a decimal written as a JSON string (the lossless form) or as a JSON
 * integer. Doubles are refused.
 */
[[nodiscard]] std::optional<decimal_t> getDecimal(const rapidjson::Value& json);

[[nodiscard]] std::optional<std::string_view> getString(
    const rapidjson::Value& json, const char* key);

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

//-------------------------------------------------------------------------

}  // namespace finmoney::json

//-------------------------------------------------------------------------
