/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/money/Money.hpp"

//-------------------------------------------------------------------------

namespace finmoney
{

using namespace literals;

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] Result<void> checkTick(decimal_t tick)
{
    if (!util::isFinite(tick) || !(tick > 0_dec)) {
        return std::unexpected{MoneyError::invalidTickSize(
            fmt::format("tick should be a finite positive decimal, was {}", tick))};
    }
    return {};
}

}  // namespace

//-------------------------------------------------------------------------

std::optional<uint32_t> Money::tickDecimalPlaces(decimal_t tick)
{
    if (!util::isFinite(tick) || !(tick > 0_dec) || tick > 1_dec) {
        return std::nullopt;
    }
    const uint32_t places = util::fractionalDigits(tick);
    if (util::scaleByPowerOf10(tick, static_cast<int32_t>(places)) != 1_dec) {
        return std::nullopt;
    }
    return places;
}

//-------------------------------------------------------------------------

Result<Money> Money::toTick(decimal_t tick, RoundingStrategy strategy) const
{
    if (auto check = checkTick(tick); !check.has_value()) {
        return std::unexpected{std::move(check).error()};
    }

    if (!util::isFinite(m_amount)) {
        return *this;
    }
    if (const auto places = tickDecimalPlaces(tick)) {
        return roundToPlaces(places.value(), strategy);
    }

    const decimal_t remainder = util::fmod(m_amount, tick);
    if (remainder == 0_dec) {
        return *this;
    }

    // Lattice neighbours of the amount: towardZero and towardZero +/- tick.
    const decimal_t towardZero = m_amount - remainder;
    const decimal_t twiceRemainder = util::abs(remainder) * 2_dec;
    const auto position = twiceRemainder < tick
        ? rounding::Remainder::BELOW_HALF
        : twiceRemainder == tick ? rounding::Remainder::HALF : rounding::Remainder::ABOVE_HALF;
    const bool negative = m_amount < 0_dec;
    const bool towardZeroIsEven = util::fmod(towardZero / tick, 2_dec) == 0_dec;

    if (!rounding::roundsAwayFromZero(strategy, position, negative, towardZeroIsEven)) {
        return Money{towardZero == 0_dec ? decimal_t{} : towardZero, m_currency};
    }
    return Money{negative ? towardZero - tick : towardZero + tick, m_currency};
}

//-------------------------------------------------------------------------

Result<Money> Money::toTickNearest(decimal_t tick) const
{
    return toTick(tick, RoundingStrategy::MIDPOINT_NEAREST_EVEN);
}

Result<Money> Money::toTickDown(decimal_t tick) const
{
    return toTick(tick, RoundingStrategy::FLOOR);
}

Result<Money> Money::toTickUp(decimal_t tick) const
{
    return toTick(tick, RoundingStrategy::CEILING);
}

//-------------------------------------------------------------------------

bool Money::isMultipleOfTick(decimal_t tick) const
{
    return checkTick(tick).has_value()
        && util::isFinite(m_amount)
        && util::fmod(m_amount, tick) == 0_dec;
}

//-------------------------------------------------------------------------

}  // namespace finmoney

//-------------------------------------------------------------------------
