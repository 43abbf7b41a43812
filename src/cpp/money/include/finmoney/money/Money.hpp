/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "finmoney/currency/Currency.hpp"
#include "finmoney/decimal/decimal.hpp"
#include "finmoney/error/MoneyError.hpp"
#include "finmoney/rounding/RoundingStrategy.hpp"

#include <fmt/format.h>
#include <rapidjson/document.h>

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace finmoney
{

//-------------------------------------------------------------------------

/**
 * An exact decimal amount bound to a currency.
 *
 * Money is an immutable value: every operation returns a new instance or a
 * MoneyError. Operations involving two Money values check that both carry the
 * same currency code before computing anything. Only division rounds, to the
 * currency's decimal places; every other operation keeps the full precision
 * of its operands.
 */
class Money
{
public:
    Money() noexcept = default;
    Money(decimal_t amount, const Currency& currency) noexcept;

    [[nodiscard]] static Money zero(const Currency& currency) noexcept;
    [[nodiscard]] static Money createRounded(
        decimal_t amount,
        const Currency& currency,
        RoundingStrategy strategy = kDefaultRoundingStrategy);
    [[nodiscard]] static Result<Money> parse(std::string_view amount, const Currency& currency);
    [[nodiscard]] static Result<Money> fromJson(const rapidjson::Value& json);

    [[nodiscard]] decimal_t amount() const noexcept { return m_amount; }
    [[nodiscard]] const Currency& currency() const noexcept { return m_currency; }
    [[nodiscard]] int32_t currencyId() const noexcept { return m_currency.id(); }
    [[nodiscard]] std::string_view currencyCode() const noexcept { return m_currency.code(); }
    [[nodiscard]] uint32_t decimalPlaces() const noexcept { return m_currency.decimalPlaces(); }

    [[nodiscard]] Result<Money> add(const Money& other) const;
    [[nodiscard]] Result<Money> subtract(const Money& other) const;
    [[nodiscard]] Result<Money> plus(decimal_t amount) const;
    [[nodiscard]] Result<Money> minus(decimal_t amount) const;
    [[nodiscard]] Result<Money> multiplyByMoney(const Money& other) const;
    [[nodiscard]] Money multiplyByDecimal(decimal_t factor) const;
    [[nodiscard]] Result<Money> divideByMoney(
        const Money& other, RoundingStrategy strategy = kDefaultRoundingStrategy) const;
    /**
     * Quotient rounded to the currency's places with strategy, decided
     * against the exact quotient rather than its 34-digit approximation.
     */
    [[nodiscard]] Result<Money> divideByDecimal(
        decimal_t divisor, RoundingStrategy strategy = kDefaultRoundingStrategy) const;

    [[nodiscard]] Result<std::strong_ordering> compare(const Money& other) const;
    [[nodiscard]] Result<bool> isGreaterThan(const Money& other) const;
    [[nodiscard]] Result<bool> isGreaterThanOrEqual(const Money& other) const;
    [[nodiscard]] Result<bool> isLessThan(const Money& other) const;
    [[nodiscard]] Result<bool> isLessThanOrEqual(const Money& other) const;
    [[nodiscard]] Result<Money> min(const Money& other) const;
    [[nodiscard]] Result<Money> max(const Money& other) const;

    [[nodiscard]] bool isGreaterThanDecimal(decimal_t val) const noexcept { return m_amount > val; }
    [[nodiscard]] bool isGreaterThanOrEqualDecimal(decimal_t val) const noexcept { return m_amount >= val; }
    [[nodiscard]] bool isLessThanDecimal(decimal_t val) const noexcept { return m_amount < val; }
    [[nodiscard]] bool isLessThanOrEqualDecimal(decimal_t val) const noexcept { return m_amount <= val; }

    [[nodiscard]] bool isSameCurrency(const Money& other) const noexcept;
    [[nodiscard]] bool isEqualTo(const Money& other) const noexcept;

    [[nodiscard]] bool isZero() const noexcept;
    [[nodiscard]] bool isPositive() const noexcept;
    [[nodiscard]] bool isNegative() const noexcept;
    [[nodiscard]] bool isPositiveOrZero() const noexcept;
    [[nodiscard]] bool isNegativeOrZero() const noexcept;
    [[nodiscard]] bool isInteger() const;
    [[nodiscard]] bool hasFraction() const;

    [[nodiscard]] Money abs() const noexcept;
    [[nodiscard]] Money negated() const noexcept;

    // Floor, ceiling and truncation to the currency's smallest unit, not to an integer.
    [[nodiscard]] Money floor() const;
    [[nodiscard]] Money ceil() const;
    [[nodiscard]] Money trunc() const;

    [[nodiscard]] Money rounded(RoundingStrategy strategy = kDefaultRoundingStrategy) const;
    [[nodiscard]] Money roundToPlaces(
        uint32_t decimalPlaces, RoundingStrategy strategy = kDefaultRoundingStrategy) const;
    [[nodiscard]] Result<Money> rescale(uint32_t decimalPlaces) const;

    /**
     * (this - initial) * 100 / initial, unrounded.
     */
    [[nodiscard]] Result<decimal_t> percentChangeFrom(const Money& initial) const;
    [[nodiscard]] Result<decimal_t> negativePercentChangeFrom(const Money& initial) const;
    [[nodiscard]] static Result<decimal_t> percentChange(const Money& initial, const Money& current);
    [[nodiscard]] static Result<decimal_t> negativePercentChange(
        const Money& initial, const Money& current);

    /**
     * Snaps the amount onto the lattice of multiples of tick, choosing
     * between the two enclosing multiples with strategy. The result is not
     * re-rounded to the currency's decimal places.
     */
    [[nodiscard]] Result<Money> toTick(decimal_t tick, RoundingStrategy strategy) const;
    [[nodiscard]] Result<Money> toTickNearest(decimal_t tick) const;
    [[nodiscard]] Result<Money> toTickDown(decimal_t tick) const;
    [[nodiscard]] Result<Money> toTickUp(decimal_t tick) const;
    [[nodiscard]] bool isMultipleOfTick(decimal_t tick) const;

    // n when tick is exactly 10^-n, e.g. 0.001 -> 3.
    [[nodiscard]] static std::optional<uint32_t> tickDecimalPlaces(decimal_t tick);

    [[nodiscard]] std::string toString() const;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] Money operator-() const noexcept { return negated(); }

    friend Money operator*(const Money& money, decimal_t factor) { return money.multiplyByDecimal(factor); }
    friend Money operator*(decimal_t factor, const Money& money) { return money.multiplyByDecimal(factor); }

    friend bool operator==(const Money& lhs, const Money& rhs) noexcept { return lhs.isEqualTo(rhs); }

    friend std::ostream& operator<<(std::ostream& os, const Money& money);

private:
    [[nodiscard]] MoneyError mismatch(const Money& other) const;

    decimal_t m_amount{};
    Currency m_currency{};
};

//-------------------------------------------------------------------------

}  // namespace finmoney

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<finmoney::Money>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const finmoney::Money& money, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", money.toString());
    }
};

//-------------------------------------------------------------------------
