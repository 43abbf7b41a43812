/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalconvertutil.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DL(lit)

//-------------------------------------------------------------------------

namespace finmoney
{

using decimal_t = BloombergLP::bdldfp::Decimal128;

}  // namespace finmoney

//-------------------------------------------------------------------------

namespace finmoney::util
{

// Coefficient digits and smallest exponent of an IEEE 754 decimal128.
inline constexpr uint32_t kDecimalDigits = 34;
inline constexpr uint32_t kMaxScale = 6176;

using PackedDecimal = std::array<uint8_t, 16>;

[[nodiscard]] inline bool isFinite(decimal_t val) noexcept
{
    return BloombergLP::bdldfp::DecimalUtil::isFinite(val);
}

[[nodiscard]] inline decimal_t abs(decimal_t val) noexcept
{
    return val < decimal_t{} ? -val : val;
}

[[nodiscard]] inline decimal_t trunc(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalUtil::trunc(val);
}

/**
 * Remainder of a / b carrying the sign of a. Exact for finite operands.
 */
[[nodiscard]] inline decimal_t fmod(decimal_t a, decimal_t b)
{
    return BloombergLP::bdldfp::DecimalUtil::fmod(a, b);
}

/**
 * a * b + c with a single rounding, so the sign of the result is exact.
 */
[[nodiscard]] inline decimal_t fma(decimal_t a, decimal_t b, decimal_t c)
{
    return BloombergLP::bdldfp::DecimalUtil::fma(a, b, c);
}

[[nodiscard]] inline decimal_t scaleByPowerOf10(decimal_t val, int32_t exponent)
{
    return BloombergLP::bdldfp::DecimalUtil::multiplyByPowerOf10(val, exponent);
}

[[nodiscard]] inline bool isInteger(decimal_t val)
{
    return isFinite(val) && trunc(val) == val;
}

/**
 * Smallest number of fractional digits needed to write val exactly, so
 * 10.50 yields 1 and 3 yields 0.
 */
[[nodiscard]] uint32_t fractionalDigits(decimal_t val);

/**
 * Exact parse. Text carrying more than kDecimalDigits significant digits
 * would be rounded and is refused instead.
 */
[[nodiscard]] std::optional<decimal_t> parseDecimal(std::string_view str);

/**
 * Exact text form that parseDecimal reads back to the identical value.
 */
[[nodiscard]] std::string decimal2str(decimal_t val);

[[nodiscard]] std::string formatFixed(decimal_t val, uint32_t decimalPlaces);

[[nodiscard]] inline PackedDecimal packDecimal(decimal_t val)
{
    PackedDecimal packed{};
    BloombergLP::bdldfp::DecimalConvertUtil::decimalToDPD(packed.data(), val);
    return packed;
}

[[nodiscard]] inline decimal_t unpackDecimal(const PackedDecimal& val)
{
    decimal_t unpacked;
    BloombergLP::bdldfp::DecimalConvertUtil::decimalFromDPD(&unpacked, val.data());
    return unpacked;
}

}  // namespace finmoney::util

//-------------------------------------------------------------------------

namespace finmoney::literals
{

[[nodiscard]] constexpr decimal_t operator""_dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace finmoney::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<finmoney::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(finmoney::decimal_t val, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", finmoney::util::decimal2str(val));
    }
};

//-------------------------------------------------------------------------
