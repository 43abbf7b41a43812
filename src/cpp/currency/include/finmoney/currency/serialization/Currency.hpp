/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "finmoney/currency/Currency.hpp"
#include "finmoney/logging/Logger.hpp"
#include "finmoney/serialization/msgpack_util.hpp"

#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace finmoney::serialization
{

/**
 * Reads the {id, code, name, decimalPlaces} map written by pack<Currency>,
 * running it through Currency::create.
 */
[[nodiscard]] inline Result<Currency> currencyFromMsgPack(const msgpack::object& o)
{
    try {
        const auto id = msgpackRequire(o, "id").as<int32_t>();
        const auto code = msgpackRequire(o, "code").as<std::string_view>();
        const auto decimalPlaces = msgpackRequire(o, "decimalPlaces").as<uint32_t>();
        std::optional<std::string_view> name;
        if (const msgpack::object* val = msgpackFind(o, "name")) {
            name = val->as<std::optional<std::string_view>>();
        }
        return Currency::create(id, code, name, decimalPlaces);
    }
    catch (const msgpack::type_error& e) {
        log::logger().warn("Failed to read currency from msgpack: {}", e.what());
        return std::unexpected{MoneyError::invalidCurrency(e.what())};
    }
}

}  // namespace finmoney::serialization

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

template<>
struct convert<finmoney::Currency>
{
    const msgpack::object& operator()(const msgpack::object& o, finmoney::Currency& v) const
    {
        auto currency = finmoney::serialization::currencyFromMsgPack(o);
        if (!currency.has_value()) {
            throw finmoney::serialization::MsgPackError{currency.error().toString()};
        }
        v = currency.value();
        return o;
    }
};

template<>
struct pack<finmoney::Currency>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, const finmoney::Currency& v) const
    {
        using namespace std::string_literals;

        o.pack_map(4);

        o.pack("id"s);
        o.pack(v.id());

        o.pack("code"s);
        o.pack(v.code());

        o.pack("name"s);
        if (const auto name = v.name(); name.has_value()) {
            o.pack(name.value());
        } else {
            o.pack_nil();
        }

        o.pack("decimalPlaces"s);
        o.pack(v.decimalPlaces());

        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
