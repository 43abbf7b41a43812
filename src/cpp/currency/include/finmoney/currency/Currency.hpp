/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "finmoney/currency/FixedAsciiStr.hpp"
#include "finmoney/error/MoneyError.hpp"

#include <fmt/format.h>
#include <pugixml.hpp>
#include <rapidjson/document.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace finmoney
{

//-------------------------------------------------------------------------

/**
 * Currency identity plus the metadata money arithmetic needs.
 *
 * Identity is the upper-cased code alone: two currencies with the same code
 * compare and hash equal whatever their id or name. Values are immutable and
 * only come out of the validating factories or the well-known constants.
 */
class Currency
{
public:
    using Code = FixedAsciiStr<16>;
    using Name = FixedAsciiStr<52>;

    // Largest scale every amount of a currency can be rounded to.
    static constexpr uint32_t kMaxDecimalPlaces = 28;

    constexpr Currency() noexcept : Currency{0, Code{"UNDEFINED"}, std::nullopt, 8} {}

    /**
     * code must be 1-16 printable ASCII characters without spaces and is
     * upper-cased; name, when given, 1-52 printable ASCII characters.
     */
    [[nodiscard]] static Result<Currency> create(
        int32_t id,
        std::string_view code,
        std::optional<std::string_view> name,
        uint32_t decimalPlaces);

    // Same checks as create() for callers already holding bounded keys.
    [[nodiscard]] static Result<Currency> fromPrecomputed(
        int32_t id, Code code, std::optional<Name> name, uint32_t decimalPlaces);

    /**
     * Never fails: bad characters become '_', overlong input is cut to
     * capacity, decimalPlaces is clamped and an unusable code becomes INVALID.
     */
    [[nodiscard]] static Currency createSanitized(
        int32_t id,
        std::string_view code,
        std::optional<std::string_view> name,
        uint32_t decimalPlaces) noexcept;

    [[nodiscard]] static Result<Currency> fromXML(pugi::xml_node node);
    [[nodiscard]] static Result<Currency> fromJson(const rapidjson::Value& json);

    [[nodiscard]] constexpr int32_t id() const noexcept { return m_id; }
    [[nodiscard]] constexpr std::string_view code() const noexcept { return m_code.view(); }
    [[nodiscard]] constexpr const Code& codeKey() const noexcept { return m_code; }
    [[nodiscard]] constexpr uint32_t decimalPlaces() const noexcept { return m_decimalPlaces; }
    [[nodiscard]] std::optional<std::string_view> name() const noexcept;

    [[nodiscard]] Result<Currency> withDecimalPlaces(uint32_t decimalPlaces) const;

    [[nodiscard]] constexpr bool isSameCurrency(const Currency& other) const noexcept
    {
        return m_code == other.m_code;
    }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    friend constexpr bool operator==(const Currency& lhs, const Currency& rhs) noexcept
    {
        return lhs.isSameCurrency(rhs);
    }

    friend std::ostream& operator<<(std::ostream& os, const Currency& currency);

    static const Currency USD;
    static const Currency EUR;
    static const Currency GBP;
    static const Currency JPY;
    static const Currency BTC;
    static const Currency ETH;
    static const Currency USDT;

private:
    constexpr Currency(
        int32_t id, Code code, std::optional<Name> name, uint32_t decimalPlaces) noexcept
        : m_id{id}, m_name{name}, m_code{code}, m_decimalPlaces{decimalPlaces}
    {}

    int32_t m_id;
    std::optional<Name> m_name;
    Code m_code;
    uint32_t m_decimalPlaces;
};

//-------------------------------------------------------------------------

inline constexpr Currency Currency::USD{1, Code{"USD"}, Name{"US Dollar"}, 2};
inline constexpr Currency Currency::EUR{2, Code{"EUR"}, Name{"Euro"}, 2};
inline constexpr Currency Currency::BTC{3, Code{"BTC"}, Name{"Bitcoin"}, 8};
inline constexpr Currency Currency::ETH{4, Code{"ETH"}, Name{"Ether"}, 18};
inline constexpr Currency Currency::GBP{5, Code{"GBP"}, Name{"Pound Sterling"}, 2};
inline constexpr Currency Currency::JPY{6, Code{"JPY"}, Name{"Japanese Yen"}, 0};
inline constexpr Currency Currency::USDT{7, Code{"USDT"}, Name{"Tether USD"}, 6};

//-------------------------------------------------------------------------

}  // namespace finmoney

//-------------------------------------------------------------------------

template<>
struct std::hash<finmoney::Currency>
{
    size_t operator()(const finmoney::Currency& currency) const noexcept
    {
        return std::hash<finmoney::Currency::Code>{}(currency.codeKey());
    }
};

template<>
struct fmt::formatter<finmoney::Currency> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(const finmoney::Currency& currency, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(currency.code(), ctx);
    }
};

//-------------------------------------------------------------------------
