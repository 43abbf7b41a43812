/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/money/Money.hpp"

#include "finmoney/logging/Logger.hpp"
#include "finmoney/serialization/json_util.hpp"

#include <algorithm>
#include <source_location>
#include <utility>

//-------------------------------------------------------------------------

namespace finmoney
{

using namespace literals;

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] Result<Money> checked(
    decimal_t amount,
    const Currency& currency,
    std::string_view operation,
    std::source_location sl = std::source_location::current())
{
    if (!util::isFinite(amount)) {
        return std::unexpected{MoneyError::arithmeticOverflow(
            fmt::format("{} in {} does not fit a decimal128", operation, currency.code()), sl)};
    }
    return Money{amount, currency};
}

/**
 * Rounds dividend / divisor to decimalPlaces. The 34-digit quotient may sit on
 * a lattice point or a midpoint that the exact quotient only approaches; the
 * residual dividend - candidate * divisor, taken with a single rounding,
 * tells on which side of any candidate the exact quotient lies.
 */
[[nodiscard]] decimal_t roundQuotient(
    decimal_t dividend, decimal_t divisor, uint32_t decimalPlaces, RoundingStrategy strategy)
{
    decimal_t rounded =
        rounding::roundToPlaces(dividend / divisor, decimalPlaces, strategy);
    if (!util::isFinite(rounded)) {
        return rounded;
    }

    // Sign of (exact quotient - value).
    const auto sideOf = [&](decimal_t value) {
        const decimal_t residual = util::fma(-value, divisor, dividend);
        if (residual == 0_dec) {
            return 0;
        }
        return (residual > 0_dec) == (divisor > 0_dec) ? 1 : -1;
    };

    const int side = sideOf(rounded);
    if (side == 0) {
        return rounded;
    }

    const decimal_t unit = util::scaleByPowerOf10(1_dec, -static_cast<int32_t>(decimalPlaces));
    const decimal_t step = side > 0 ? unit : -unit;

    bool stepTowardQuotient = false;
    switch (strategy) {
        case RoundingStrategy::FLOOR:
            stepTowardQuotient = side < 0;
            break;
        case RoundingStrategy::CEILING:
            stepTowardQuotient = side > 0;
            break;
        case RoundingStrategy::TO_ZERO:
            stepTowardQuotient = (rounded > 0_dec && side < 0) || (rounded < 0_dec && side > 0);
            break;
        case RoundingStrategy::AWAY_FROM_ZERO:
            stepTowardQuotient = (rounded >= 0_dec && side > 0) || (rounded <= 0_dec && side < 0);
            break;
        default:
            // Midpoint strategies: step only when the exact quotient lies past
            // the midpoint between rounded and its neighbour.
            stepTowardQuotient = sideOf(rounded + step / 2_dec) == side;
            break;
    }

    if (stepTowardQuotient) {
        rounded += step;
    }
    return rounded == 0_dec ? decimal_t{} : rounded;
}

}  // namespace

//-------------------------------------------------------------------------

Money::Money(decimal_t amount, const Currency& currency) noexcept
    : m_amount{amount}, m_currency{currency}
{}

//-------------------------------------------------------------------------

Money Money::zero(const Currency& currency) noexcept
{
    return Money{decimal_t{}, currency};
}

//-------------------------------------------------------------------------

Money Money::createRounded(decimal_t amount, const Currency& currency, RoundingStrategy strategy)
{
    return Money{rounding::roundToPlaces(amount, currency.decimalPlaces(), strategy), currency};
}

//-------------------------------------------------------------------------

Result<Money> Money::parse(std::string_view amount, const Currency& currency)
{
    const auto parsed = util::parseDecimal(amount);
    if (!parsed.has_value() || !util::isFinite(parsed.value())) {
        auto err = MoneyError::invalidAmount(fmt::format("'{}' is not a finite decimal", amount));
        log::logger().debug("Rejected amount: {}", err.toString());
        return std::unexpected{std::move(err)};
    }
    return Money{parsed.value(), currency};
}

//-------------------------------------------------------------------------

Result<Money> Money::fromJson(const rapidjson::Value& json)
{
    if (!json.IsObject() || !json.HasMember("amount") || !json.HasMember("currency")) {
        auto err = MoneyError::invalidAmount("money object needs 'amount' and 'currency'");
        log::logger().warn("Failed to read money from JSON: {}", err.toString());
        return std::unexpected{std::move(err)};
    }

    const auto amount = json::getDecimal(json["amount"]);
    if (!amount.has_value() || !util::isFinite(amount.value())) {
        auto err = MoneyError::invalidAmount(
            "'amount' should be a decimal string or an integer");
        log::logger().warn("Failed to read money from JSON: {}", err.toString());
        return std::unexpected{std::move(err)};
    }

    auto currency = Currency::fromJson(json["currency"]);
    if (!currency.has_value()) {
        log::logger().warn("Failed to read money from JSON: {}", currency.error().toString());
        return std::unexpected{std::move(currency).error()};
    }

    return Money{amount.value(), currency.value()};
}

//-------------------------------------------------------------------------

MoneyError Money::mismatch(const Money& other) const
{
    return MoneyError::currencyMismatch(currencyCode(), other.currencyCode());
}

//-------------------------------------------------------------------------

Result<Money> Money::add(const Money& other) const
{
    if (!isSameCurrency(other)) {
        return std::unexpected{mismatch(other)};
    }
    return checked(m_amount + other.m_amount, m_currency, "addition");
}

//-------------------------------------------------------------------------

Result<Money> Money::subtract(const Money& other) const
{
    if (!isSameCurrency(other)) {
        return std::unexpected{mismatch(other)};
    }
    return checked(m_amount - other.m_amount, m_currency, "subtraction");
}

//-------------------------------------------------------------------------

Result<Money> Money::plus(decimal_t amount) const
{
    return checked(m_amount + amount, m_currency, "addition");
}

//-------------------------------------------------------------------------

Result<Money> Money::minus(decimal_t amount) const
{
    return checked(m_amount - amount, m_currency, "subtraction");
}

//-------------------------------------------------------------------------

Result<Money> Money::multiplyByMoney(const Money& other) const
{
    if (!isSameCurrency(other)) {
        return std::unexpected{mismatch(other)};
    }
    return checked(m_amount * other.m_amount, m_currency, "multiplication");
}

//-------------------------------------------------------------------------

Money Money::multiplyByDecimal(decimal_t factor) const
{
    return Money{m_amount * factor, m_currency};
}

//-------------------------------------------------------------------------

Result<Money> Money::divideByMoney(const Money& other, RoundingStrategy strategy) const
{
    if (!isSameCurrency(other)) {
        return std::unexpected{mismatch(other)};
    }
    return divideByDecimal(other.m_amount, strategy);
}

//-------------------------------------------------------------------------

Result<Money> Money::divideByDecimal(decimal_t divisor, RoundingStrategy strategy) const
{
    if (divisor == 0_dec) {
        return std::unexpected{MoneyError::divisionByZero()};
    }
    return checked(
        roundQuotient(m_amount, divisor, decimalPlaces(), strategy), m_currency, "division");
}

//-------------------------------------------------------------------------

Result<std::strong_ordering> Money::compare(const Money& other) const
{
    if (!isSameCurrency(other)) {
        return std::unexpected{mismatch(other)};
    }
    if (m_amount < other.m_amount) return std::strong_ordering::less;
    if (m_amount > other.m_amount) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

//-------------------------------------------------------------------------

Result<bool> Money::isGreaterThan(const Money& other) const
{
    return compare(other).transform([](std::strong_ordering ord) { return ord > 0; });
}

Result<bool> Money::isGreaterThanOrEqual(const Money& other) const
{
    return compare(other).transform([](std::strong_ordering ord) { return ord >= 0; });
}

Result<bool> Money::isLessThan(const Money& other) const
{
    return compare(other).transform([](std::strong_ordering ord) { return ord < 0; });
}

Result<bool> Money::isLessThanOrEqual(const Money& other) const
{
    return compare(other).transform([](std::strong_ordering ord) { return ord <= 0; });
}

//-------------------------------------------------------------------------

Result<Money> Money::min(const Money& other) const
{
    return compare(other).transform(
        [&](std::strong_ordering ord) { return ord > 0 ? other : *this; });
}

//-------------------------------------------------------------------------

Result<Money> Money::max(const Money& other) const
{
    return compare(other).transform(
        [&](std::strong_ordering ord) { return ord < 0 ? other : *this; });
}

//-------------------------------------------------------------------------

bool Money::isSameCurrency(const Money& other) const noexcept
{
    return m_currency.isSameCurrency(other.m_currency);
}

//-------------------------------------------------------------------------

bool Money::isEqualTo(const Money& other) const noexcept
{
    return isSameCurrency(other) && m_amount == other.m_amount;
}

//-------------------------------------------------------------------------

bool Money::isZero() const noexcept
{
    return m_amount == 0_dec;
}

bool Money::isPositive() const noexcept
{
    return m_amount > 0_dec;
}

bool Money::isNegative() const noexcept
{
    return m_amount < 0_dec;
}

bool Money::isPositiveOrZero() const noexcept
{
    return m_amount >= 0_dec;
}

bool Money::isNegativeOrZero() const noexcept
{
    return m_amount <= 0_dec;
}

bool Money::isInteger() const
{
    return util::isInteger(m_amount);
}

bool Money::hasFraction() const
{
    return util::isFinite(m_amount) && !util::isInteger(m_amount);
}

//-------------------------------------------------------------------------

Money Money::abs() const noexcept
{
    return Money{util::abs(m_amount), m_currency};
}

//-------------------------------------------------------------------------

Money Money::negated() const noexcept
{
    return Money{-m_amount, m_currency};
}

//-------------------------------------------------------------------------

Money Money::floor() const
{
    return roundToPlaces(decimalPlaces(), RoundingStrategy::FLOOR);
}

Money Money::ceil() const
{
    return roundToPlaces(decimalPlaces(), RoundingStrategy::CEILING);
}

Money Money::trunc() const
{
    return roundToPlaces(decimalPlaces(), RoundingStrategy::TO_ZERO);
}

//-------------------------------------------------------------------------

Money Money::rounded(RoundingStrategy strategy) const
{
    return roundToPlaces(decimalPlaces(), strategy);
}

//-------------------------------------------------------------------------

Money Money::roundToPlaces(uint32_t decimalPlaces, RoundingStrategy strategy) const
{
    return Money{rounding::roundToPlaces(m_amount, decimalPlaces, strategy), m_currency};
}

//-------------------------------------------------------------------------

Result<Money> Money::rescale(uint32_t decimalPlaces) const
{
    return m_currency.withDecimalPlaces(decimalPlaces).transform([&](const Currency& currency) {
        return Money{rounding::roundToPlaces(m_amount, decimalPlaces), currency};
    });
}

//-------------------------------------------------------------------------

Result<decimal_t> Money::percentChangeFrom(const Money& initial) const
{
    if (!isSameCurrency(initial)) {
        return std::unexpected{mismatch(initial)};
    }
    if (initial.isZero()) {
        return std::unexpected{MoneyError::divisionByZero()};
    }
    const decimal_t change = (m_amount - initial.m_amount) * 100_dec / initial.m_amount;
    if (!util::isFinite(change)) {
        return std::unexpected{MoneyError::arithmeticOverflow(fmt::format(
            "change from {} to {} does not fit a decimal128", initial.m_amount, m_amount))};
    }
    return change;
}

Result<decimal_t> Money::negativePercentChangeFrom(const Money& initial) const
{
    return percentChangeFrom(initial).transform([](decimal_t change) {
        return change == 0_dec ? decimal_t{} : -change;
    });
}

//-------------------------------------------------------------------------

Result<decimal_t> Money::percentChange(const Money& initial, const Money& current)
{
    return current.percentChangeFrom(initial);
}

Result<decimal_t> Money::negativePercentChange(const Money& initial, const Money& current)
{
    return current.negativePercentChangeFrom(initial);
}

//-------------------------------------------------------------------------

std::string Money::toString() const
{
    const uint32_t places = util::isFinite(m_amount)
        ? std::max(decimalPlaces(), util::fractionalDigits(m_amount))
        : decimalPlaces();
    return fmt::format("{} {}", util::formatFixed(m_amount, places), currencyCode());
}

//-------------------------------------------------------------------------

void Money::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        const std::string amount = util::decimal2str(m_amount);
        json.AddMember(
            "amount",
            rapidjson::Value{amount.c_str(), static_cast<rapidjson::SizeType>(amount.size()), allocator},
            allocator);
        m_currency.jsonSerialize(json, "currency");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::ostream& operator<<(std::ostream& os, const Money& money)
{
    return os << money.toString();
}

//-------------------------------------------------------------------------

}  // namespace finmoney

//-------------------------------------------------------------------------
