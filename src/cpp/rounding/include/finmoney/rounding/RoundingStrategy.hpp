/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "finmoney/decimal/decimal.hpp"

#include <cstdint>

//-------------------------------------------------------------------------

namespace finmoney
{

//-------------------------------------------------------------------------

enum class RoundingStrategy : uint32_t
{
    MIDPOINT_NEAREST_EVEN,   // 6.5 -> 6, 7.5 -> 8, -6.5 -> -6 (banker's rounding)
    MIDPOINT_AWAY_FROM_ZERO, // 6.5 -> 7, -6.5 -> -7
    MIDPOINT_TOWARD_ZERO,    // 6.5 -> 6, -6.5 -> -6
    TO_ZERO,                 // 6.8 -> 6, -6.8 -> -6
    AWAY_FROM_ZERO,          // 6.2 -> 7, -6.2 -> -7
    FLOOR,                   // 6.8 -> 6, -6.2 -> -7
    CEILING                  // 6.2 -> 7, -6.8 -> -6
};

inline constexpr RoundingStrategy kDefaultRoundingStrategy = RoundingStrategy::MIDPOINT_NEAREST_EVEN;

//-------------------------------------------------------------------------

namespace rounding
{

// Size of the discarded part relative to half of the step being rounded to.
enum class Remainder : uint32_t
{
    ZERO,
    BELOW_HALF,
    HALF,
    ABOVE_HALF
};

/**
 * Whether a value lying strictly between two neighbours on some lattice
 * (integers, cents, ticks) moves from the neighbour closer to zero to the
 * one further from it.
 */
[[nodiscard]] bool roundsAwayFromZero(
    RoundingStrategy strategy,
    Remainder remainder,
    bool negative,
    bool towardZeroIsEven) noexcept;

/**
 * Rounds value to decimalPlaces fractional digits. Places beyond what the
 * value carries leave it untouched; non-finite values pass through.
 */
[[nodiscard]] decimal_t roundToPlaces(
    decimal_t value,
    uint32_t decimalPlaces,
    RoundingStrategy strategy = kDefaultRoundingStrategy);

}  // namespace rounding

//-------------------------------------------------------------------------

}  // namespace finmoney

//-------------------------------------------------------------------------
