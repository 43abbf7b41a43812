/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/rounding/RoundingStrategy.hpp"

#include <algorithm>
#include <utility>

//-------------------------------------------------------------------------

namespace finmoney::rounding
{

using namespace literals;

//-------------------------------------------------------------------------

bool roundsAwayFromZero(
    RoundingStrategy strategy,
    Remainder remainder,
    bool negative,
    bool towardZeroIsEven) noexcept
{
    if (remainder == Remainder::ZERO) {
        return false;
    }

    switch (strategy) {
        case RoundingStrategy::MIDPOINT_NEAREST_EVEN:
            return remainder == Remainder::ABOVE_HALF
                || (remainder == Remainder::HALF && !towardZeroIsEven);
        case RoundingStrategy::MIDPOINT_AWAY_FROM_ZERO:
            return remainder != Remainder::BELOW_HALF;
        case RoundingStrategy::MIDPOINT_TOWARD_ZERO:
            return remainder == Remainder::ABOVE_HALF;
        case RoundingStrategy::TO_ZERO:
            return false;
        case RoundingStrategy::AWAY_FROM_ZERO:
            return true;
        case RoundingStrategy::FLOOR:
            return negative;
        case RoundingStrategy::CEILING:
            return !negative;
        default:
            std::unreachable();
    }
}

//-------------------------------------------------------------------------

decimal_t roundToPlaces(decimal_t value, uint32_t decimalPlaces, RoundingStrategy strategy)
{
    static const decimal_t half = DEC(0.5);

    if (!util::isFinite(value)) {
        return value;
    }

    const auto places = static_cast<int32_t>(std::min(decimalPlaces, util::kMaxScale));
    const decimal_t scaled = util::scaleByPowerOf10(value, places);
    if (!util::isFinite(scaled)) {
        // Only magnitudes with no fractional digits at all overflow here.
        return value;
    }

    const decimal_t towardZero = util::trunc(scaled);
    const decimal_t discarded = util::abs(scaled - towardZero);
    if (discarded == 0_dec) {
        return value;
    }

    const Remainder remainder = discarded < half
        ? Remainder::BELOW_HALF
        : discarded == half ? Remainder::HALF : Remainder::ABOVE_HALF;
    const bool negative = scaled < 0_dec;

    decimal_t rounded = towardZero;
    if (roundsAwayFromZero(
            strategy, remainder, negative, util::fmod(towardZero, 2_dec) == 0_dec)) {
        rounded = negative ? towardZero - 1_dec : towardZero + 1_dec;
    }
    if (rounded == 0_dec) {
        rounded = 0_dec;  // no negative zero
    }

    return util::scaleByPowerOf10(rounded, -places);
}

//-------------------------------------------------------------------------

}  // namespace finmoney::rounding

//-------------------------------------------------------------------------
