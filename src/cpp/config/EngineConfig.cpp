/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/config/EngineConfig.hpp"

#include "finmoney/logging/Logger.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>
#include <magic_enum.hpp>

#include <algorithm>
#include <string>
#include <utility>

//-------------------------------------------------------------------------

namespace finmoney::config
{

//-------------------------------------------------------------------------

std::optional<Currency> EngineConfig::findCurrency(std::string_view code) const
{
    const auto it = std::ranges::find_if(
        currencies,
        [code](const Currency& c) { return boost::algorithm::iequals(c.code(), code); });
    return it != currencies.end() ? std::make_optional(*it) : std::nullopt;
}

//-------------------------------------------------------------------------

Result<EngineConfig> makeEngineConfig(pugi::xml_node node)
{
    EngineConfig config;

    if (pugi::xml_attribute attr = node.attribute("rounding")) {
        const auto rounding = magic_enum::enum_cast<RoundingStrategy>(attr.as_string());
        if (!rounding.has_value()) {
            return std::unexpected{MoneyError::invalidConfig(
                fmt::format("unknown rounding strategy '{}'", attr.as_string()))};
        }
        config.rounding = rounding.value();
    }

    if (pugi::xml_attribute attr = node.attribute("logLevel")) {
        const auto level = magic_enum::enum_cast<spdlog::level::level_enum>(attr.as_string());
        if (!level.has_value() || level.value() == spdlog::level::n_levels) {
            return std::unexpected{MoneyError::invalidConfig(
                fmt::format("unknown log level '{}'", attr.as_string()))};
        }
        config.logLevel = level.value();
    }

    for (pugi::xml_node child : node.children("Currency")) {
        auto currency = Currency::fromXML(child);
        if (!currency.has_value()) {
            return std::unexpected{std::move(currency).error()};
        }
        if (config.findCurrency(currency->code()).has_value()) {
            return std::unexpected{MoneyError::invalidConfig(
                fmt::format("currency '{}' is declared more than once", currency->code()))};
        }
        config.currencies.push_back(currency.value());
    }

    log::logger().info(
        "Loaded engine config: rounding {}, log level {}, {} currencies",
        magic_enum::enum_name(config.rounding),
        magic_enum::enum_name(config.logLevel),
        config.currencies.size());

    return config;
}

//-------------------------------------------------------------------------

void applyLogLevel(const EngineConfig& config)
{
    log::setLevel(config.logLevel);
}

//-------------------------------------------------------------------------

}  // namespace finmoney::config

//-------------------------------------------------------------------------
