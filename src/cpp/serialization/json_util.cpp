/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/serialization/json_util.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

//-------------------------------------------------------------------------

namespace finmoney::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    const auto& [indent] = formatOptions;
    rapidjson::StringBuffer buffer;
    if (indent.has_value()) {
        const auto& opts = indent.value();
        rapidjson::PrettyWriter writer{buffer};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        json.Accept(writer);
    } else {
        rapidjson::Writer writer{buffer};
        json.Accept(writer);
    }
    return buffer.GetString();
}

//-------------------------------------------------------------------------

std::optional<decimal_t> getDecimal(const rapidjson::Value& json)
{
    if (json.IsString()) [[likely]] {
        return util::parseDecimal({json.GetString(), json.GetStringLength()});
    } else if (json.IsUint64()) {
        return decimal_t{json.GetUint64()};
    } else if (json.IsInt64()) {
        return decimal_t{json.GetInt64()};
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

std::optional<std::string_view> getString(const rapidjson::Value& json, const char* key)
{
    if (!json.IsObject()) {
        return std::nullopt;
    }
    const auto it = json.FindMember(key);
    if (it == json.MemberEnd() || !it->value.IsString()) {
        return std::nullopt;
    }
    return std::string_view{it->value.GetString(), it->value.GetStringLength()};
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace finmoney::json

//-------------------------------------------------------------------------
