/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <expected>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace finmoney
{

//-------------------------------------------------------------------------

enum class MoneyErrorKind : uint32_t
{
    CURRENCY_MISMATCH,
    DIVISION_BY_ZERO,
    INVALID_CURRENCY,
    INVALID_TICK_SIZE,
    PRECISION_OVERFLOW,
    INVALID_AMOUNT,
    INVALID_CONFIG,
    ARITHMETIC_OVERFLOW
};

//-------------------------------------------------------------------------

/**
 * Failure value returned by every fallible operation. For CURRENCY_MISMATCH
 * expected/actual hold the two currency codes, for every other kind reason
 * describes what was rejected.
 */
struct MoneyError
{
    MoneyErrorKind kind;
    std::string expected{};
    std::string actual{};
    std::string reason{};

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] static MoneyError currencyMismatch(
        std::string_view expected, std::string_view actual);
    [[nodiscard]] static MoneyError divisionByZero() noexcept;
    [[nodiscard]] static MoneyError invalidCurrency(
        std::string reason, std::source_location sl = std::source_location::current());
    [[nodiscard]] static MoneyError invalidTickSize(
        std::string reason, std::source_location sl = std::source_location::current());
    [[nodiscard]] static MoneyError precisionOverflow(
        std::string reason, std::source_location sl = std::source_location::current());
    [[nodiscard]] static MoneyError invalidAmount(
        std::string reason, std::source_location sl = std::source_location::current());
    [[nodiscard]] static MoneyError invalidConfig(
        std::string reason, std::source_location sl = std::source_location::current());
    [[nodiscard]] static MoneyError arithmeticOverflow(
        std::string reason, std::source_location sl = std::source_location::current());

    friend bool operator==(const MoneyError&, const MoneyError&) = default;
    friend std::ostream& operator<<(std::ostream& os, const MoneyError& err);
};

//-------------------------------------------------------------------------

template<typename T>
using Result = std::expected<T, MoneyError>;

//-------------------------------------------------------------------------

}  // namespace finmoney

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<finmoney::MoneyError>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const finmoney::MoneyError& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", err.toString());
    }
};

//-------------------------------------------------------------------------
