/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <msgpack.hpp>

#include <source_location>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace finmoney::serialization
{

//-------------------------------------------------------------------------

/**
 * msgpack output buffer whose Tag selects how decimals are packed; see the
 * decimal_t adaptor. Packing the same value into either stream yields
 * payloads the same convert adaptor reads back.
 */
template<typename Tag>
class TaggedStream
{
public:
    explicit TaggedStream(size_t initByteSize = MSGPACK_SBUFFER_INIT_SIZE)
        : m_buffer{initByteSize}
    {}

    [[nodiscard]] const char* data() const noexcept { return m_buffer.data(); }
    [[nodiscard]] size_t size() const noexcept { return m_buffer.size(); }
    [[nodiscard]] std::string_view view() const noexcept { return {data(), size()}; }

    void write(const char* buf, size_t len) { m_buffer.write(buf, len); }
    void clear() noexcept { m_buffer.clear(); }

private:
    msgpack::sbuffer m_buffer;
};

struct HumanReadableTag {};
struct BinaryTag {};

// Decimals as exact text.
using HumanReadableStream = TaggedStream<HumanReadableTag>;
// Decimals as 16 DPD bytes.
using BinaryStream = TaggedStream<BinaryTag>;

//-------------------------------------------------------------------------

struct MsgPackError : msgpack::type_error
{
    std::string message;

    explicit MsgPackError(
        std::string_view detail = {},
        std::source_location sl = std::source_location::current()) noexcept
    {
        message = detail.empty()
            ? fmt::format("{}#L{}: {}", sl.file_name(), sl.line(), msgpack::type_error::what())
            : fmt::format("{}#L{}: {}", sl.file_name(), sl.line(), detail);
    }

    const char* what() const noexcept override { return message.c_str(); }
};

//-------------------------------------------------------------------------

[[nodiscard]] inline const msgpack::object* msgpackFind(
    const msgpack::object& o, std::string_view key)
{
    if (o.type != msgpack::type::MAP) {
        return nullptr;
    }
    for (size_t i = 0; i < o.via.map.size; ++i) {
        const auto& k = o.via.map.ptr[i].key;
        if (k.type == msgpack::type::STR) {
            std::string_view ks{k.via.str.ptr, k.via.str.size};
            if (ks == key) {
                return &o.via.map.ptr[i].val;
            }
        }
    }
    return nullptr;
}

[[nodiscard]] inline const msgpack::object& msgpackRequire(
    const msgpack::object& o,
    std::string_view key,
    std::source_location sl = std::source_location::current())
{
    if (const msgpack::object* val = msgpackFind(o, key)) {
        return *val;
    }
    throw MsgPackError{fmt::format("missing key '{}'", key), sl};
}

//-------------------------------------------------------------------------

}  // namespace finmoney::serialization

//-------------------------------------------------------------------------
