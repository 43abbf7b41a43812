/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "finmoney/decimal/decimal.hpp"
#include "finmoney/serialization/msgpack_util.hpp"

#include <algorithm>
#include <concepts>
#include <string_view>

//-------------------------------------------------------------------------

namespace msgpack
{

MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
{

namespace adaptor
{

template<>
struct convert<finmoney::decimal_t>
{
    const msgpack::object& operator()(const msgpack::object& o, finmoney::decimal_t& v) const
    {
        using namespace finmoney;

        if (o.type == msgpack::type::STR) {
            const std::string_view str{o.via.str.ptr, o.via.str.size};
            const auto parsed = util::parseDecimal(str);
            if (!parsed.has_value()) {
                throw serialization::MsgPackError{
                    fmt::format("'{}' is not a decimal", str)};
            }
            v = parsed.value();
        }
        else if (o.type == msgpack::type::BIN && o.via.bin.size == sizeof(util::PackedDecimal)) {
            util::PackedDecimal packed{};
            std::copy_n(o.via.bin.ptr, packed.size(), packed.begin());
            v = util::unpackDecimal(packed);
        }
        else if (o.type == msgpack::type::POSITIVE_INTEGER) {
            v = decimal_t{o.as<uint64_t>()};
        }
        else if (o.type == msgpack::type::NEGATIVE_INTEGER) {
            v = decimal_t{o.as<int64_t>()};
        }
        else {
            // Binary floating point would silently lose digits.
            throw serialization::MsgPackError{};
        }
        return o;
    }
};

template<>
struct pack<finmoney::decimal_t>
{
    template<typename Stream>
    msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, const finmoney::decimal_t& v) const
    {
        if constexpr (std::same_as<Stream, finmoney::serialization::HumanReadableStream>) {
            o.pack(finmoney::util::decimal2str(v));
        }
        else if constexpr (std::same_as<Stream, finmoney::serialization::BinaryStream>) {
            const auto packed = finmoney::util::packDecimal(v);
            o.pack_bin(static_cast<uint32_t>(packed.size()));
            o.pack_bin_body(reinterpret_cast<const char*>(packed.data()), packed.size());
        }
        else {
            static_assert(false, "Unrecognized Stream type");
        }
        return o;
    }
};

}  // namespace adaptor

}  // MSGPACK_API_VERSION_NAMESPACE

}  // namespace msgpack

//-------------------------------------------------------------------------
