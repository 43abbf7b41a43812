/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "finmoney/decimal/decimal.hpp"
#include "finmoney/error/MoneyError.hpp"
#include "finmoney/money/Money.hpp"
#include "finmoney/rounding/RoundingStrategy.hpp"

#include <magic_enum.hpp>

#include <ostream>

//-------------------------------------------------------------------------

namespace finmoney
{

inline void PrintTo(const decimal_t& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

inline void PrintTo(RoundingStrategy strategy, std::ostream* os)
{
    *os << magic_enum::enum_name(strategy);
}

inline void PrintTo(const MoneyError& err, std::ostream* os)
{
    *os << err.toString();
}

inline void PrintTo(const Money& money, std::ostream* os)
{
    *os << money.toString();
}

}  // namespace finmoney

//-------------------------------------------------------------------------
