/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "finmoney/currency/Currency.hpp"
#include "finmoney/error/MoneyError.hpp"
#include "finmoney/rounding/RoundingStrategy.hpp"

#include <pugixml.hpp>
#include <spdlog/common.h>

#include <optional>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace finmoney::config
{

//-------------------------------------------------------------------------

struct EngineConfig
{
    RoundingStrategy rounding = kDefaultRoundingStrategy;
    spdlog::level::level_enum logLevel = spdlog::level::warn;
    std::vector<Currency> currencies;

    // Lookup by code, case-insensitive.
    [[nodiscard]] std::optional<Currency> findCurrency(std::string_view code) const;
};

/**
 * Reads
 *
 *   <Money rounding="MIDPOINT_NEAREST_EVEN" logLevel="warn">
 *     <Currency id="1" code="USD" name="US Dollar" decimalPlaces="2"/>
 *   </Money>
 *
 * Both attributes are optional. Currency children go through
 * Currency::fromXML; a duplicate code is an INVALID_CONFIG error.
 */
[[nodiscard]] Result<EngineConfig> makeEngineConfig(pugi::xml_node node);

// Pushes the configured level to the library logger.
void applyLogLevel(const EngineConfig& config);

//-------------------------------------------------------------------------

}  // namespace finmoney::config

//-------------------------------------------------------------------------
