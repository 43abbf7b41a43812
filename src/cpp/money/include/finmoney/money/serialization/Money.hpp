/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "finmoney/currency/serialization/Currency.hpp"
#include "finmoney/decimal/serialization/decimal.hpp"
#include "finmoney/logging/Logger.hpp"
#include "finmoney/money/Money.hpp"
#include "finmoney/serialization/msgpack_util.hpp"

#include <cstddef>
#include <new>
#include <string>
#include <string_view>
#include <utility>

//-------------------------------------------------------------------------

namespace finmoney::serialization
{

[[nodiscard]] inline Result<Money> moneyFromMsgPack(const msgpack::object& o)
{
    decimal_t amount;
    try {
        amount = msgpackRequire(o, "amount").as<decimal_t>();
    }
    catch (const msgpack::type_error& e) {
        log::logger().warn("Failed to read money from msgpack: {}", e.what());
        return std::unexpected{MoneyError::invalidAmount(e.what())};
    }
    if (!util::isFinite(amount)) {
        auto err = MoneyError::invalidAmount(
            fmt::format("amount should be finite, was {}", amount));
        log::logger().warn("Failed to read money from msgpack: {}", err.toString());
        return std::unexpected{std::move(err)};
    }

    const msgpack::object* currency = msgpackFind(o, "currency");
    if (currency == nullptr) {
        auto err = MoneyError::invalidCurrency("missing key 'currency'");
        log::logger().warn("Failed to read money from msgpack: {}", err.toString());
        return std::unexpected{std::move(err)};
    }
    return currencyFromMsgPack(*currency).transform(
        [&](const Currency& c) { return Money{amount, c}; });
}

/**
 * Bounds for a packed Money: the outer {amount, currency} map, the currency
 * map nested in it, and no arrays or ext values at all. Anything larger is
 * refused before msgpack allocates for it.
 */
inline const msgpack::unpack_limit kMoneyUnpackLimit{
    /* array */ 0,
    /* map */ 4,
    /* str */ 128,
    /* bin */ sizeof(util::PackedDecimal),
    /* ext */ 0,
    /* depth */ 3};

/**
 * Unpacks a Money from a buffer written with either stream kind. Malformed
 * or oversized payloads are reported as INVALID_AMOUNT, bad currency maps
 * as INVALID_CURRENCY.
 */
[[nodiscard]] inline Result<Money> unpackMoney(const char* data, size_t size)
{
    const auto malformed = [](std::string_view what) {
        log::logger().warn("Failed to unpack money: {}", what);
        return std::unexpected{
            MoneyError::invalidAmount(fmt::format("malformed msgpack payload: {}", what))};
    };

    msgpack::object_handle oh;
    try {
        oh = msgpack::unpack(data, size, nullptr, nullptr, kMoneyUnpackLimit);
    }
    catch (const msgpack::unpack_error& e) {
        return malformed(e.what());
    }
    catch (const msgpack::size_overflow& e) {
        return malformed(e.what());
    }
    catch (const std::bad_alloc& e) {
        return malformed(e.what());
    }
    return moneyFromMsgPack(oh.get());
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
struct convert<finmoney::Money>
{
    const msgpack::object& operator()(const msgpack::object& o, finmoney::Money& v) const
    {
        auto money = finmoney::serialization::moneyFromMsgPack(o);
        if (!money.has_value()) {
            throw finmoney::serialization::MsgPackError{money.error().toString()};
        }
        v = money.value();
        return o;
    }
};

template<>
struct pack<finmoney::Money>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, const finmoney::Money& v) const
    {
        using namespace std::string_literals;

        o.pack_map(2);

        o.pack("amount"s);
        o.pack(v.amount());

        o.pack("currency"s);
        o.pack(v.currency());

        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
