/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/decimal/decimal.hpp"

#include <bdldfp_decimalformatconfig.h>

#include <algorithm>

//-------------------------------------------------------------------------

namespace finmoney::util
{

//-------------------------------------------------------------------------

namespace
{

std::string formatWith(decimal_t val, const BloombergLP::bdldfp::DecimalFormatConfig& cfg)
{
    using BloombergLP::bdldfp::DecimalUtil;

    const int len = DecimalUtil::format(nullptr, 0, val, cfg);
    std::string out(static_cast<size_t>(std::max(len, 0)), '\0');
    if (len > 0) {
        DecimalUtil::format(out.data(), len, val, cfg);
    }
    return out;
}

// Coefficient digits written in str, leading zeros excluded.
uint32_t writtenDigits(std::string_view str) noexcept
{
    uint32_t digits = 0;
    for (char c : str) {
        if (c == 'e' || c == 'E') {
            break;
        }
        if (c < '0' || c > '9' || (digits == 0 && c == '0')) {
            continue;
        }
        ++digits;
    }
    return digits;
}

}  // namespace

//-------------------------------------------------------------------------

uint32_t fractionalDigits(decimal_t val)
{
    if (!isFinite(val)) {
        return 0;
    }
    uint32_t digits = 0;
    while (digits < kMaxScale && !isInteger(scaleByPowerOf10(val, static_cast<int32_t>(digits)))) {
        ++digits;
    }
    return digits;
}

//-------------------------------------------------------------------------

std::optional<decimal_t> parseDecimal(std::string_view str)
{
    if (str.empty()
        || std::ranges::any_of(str, [](unsigned char c) { return c <= ' ' || c > '~'; })
        || writtenDigits(str) > kDecimalDigits) {
        return std::nullopt;
    }
    const std::string buf{str};
    decimal_t parsed;
    if (BloombergLP::bdldfp::DecimalUtil::parseDecimal128(&parsed, buf.c_str()) != 0) {
        return std::nullopt;
    }
    return parsed;
}

//-------------------------------------------------------------------------

std::string decimal2str(decimal_t val)
{
    using BloombergLP::bdldfp::DecimalFormatConfig;
    return formatWith(val, DecimalFormatConfig{0, DecimalFormatConfig::e_NATURAL});
}

//-------------------------------------------------------------------------

std::string formatFixed(decimal_t val, uint32_t decimalPlaces)
{
    using BloombergLP::bdldfp::DecimalFormatConfig;
    return formatWith(
        val, DecimalFormatConfig{static_cast<int>(decimalPlaces), DecimalFormatConfig::e_FIXED});
}

//-------------------------------------------------------------------------

}  // namespace finmoney::util

//-------------------------------------------------------------------------
