/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/config/EngineConfig.hpp"
#include "finmoney/logging/Logger.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <pugixml.hpp>

#include <filesystem>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

using namespace finmoney;

using namespace testing;

//-------------------------------------------------------------------------

static const fs::path kTestDataPath{FINMONEY_TEST_DATA_DIR};

//-------------------------------------------------------------------------

struct EngineConfigTest : Test
{
    Result<config::EngineConfig> load(const char* xml)
    {
        const pugi::xml_parse_result parsed = doc.load_string(xml);
        EXPECT_TRUE(parsed) << parsed.description();
        return config::makeEngineConfig(doc.child("Money"));
    }

    pugi::xml_document doc;
};

//-------------------------------------------------------------------------

TEST_F(EngineConfigTest, LoadsFromFile)
{
    const pugi::xml_parse_result parsed =
        doc.load_file((kTestDataPath / "EngineConfig.xml").c_str());
    ASSERT_TRUE(parsed) << parsed.description();

    const auto config = config::makeEngineConfig(doc.child("Money"));
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->rounding, RoundingStrategy::MIDPOINT_AWAY_FROM_ZERO);
    EXPECT_EQ(config->logLevel, spdlog::level::info);
    ASSERT_EQ(config->currencies.size(), 3u);

    const auto btc = config->findCurrency("BTC");
    ASSERT_TRUE(btc.has_value());
    EXPECT_EQ(btc->id(), 3);
    EXPECT_EQ(btc->decimalPlaces(), 8u);

    const auto pts = config->findCurrency("pts");
    ASSERT_TRUE(pts.has_value());
    EXPECT_EQ(pts->name(), std::nullopt);

    EXPECT_EQ(config->findCurrency("EUR"), std::nullopt);
    EXPECT_EQ(config->findCurrency(""), std::nullopt);
}

TEST_F(EngineConfigTest, DefaultsWhenAttributesAbsent)
{
    const auto config = load("<Money/>");
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->rounding, kDefaultRoundingStrategy);
    EXPECT_EQ(config->logLevel, spdlog::level::warn);
    EXPECT_THAT(config->currencies, IsEmpty());
}

TEST_F(EngineConfigTest, UnknownRoundingStrategy)
{
    const auto config = load(R"(<Money rounding="HALF_UP"/>)");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, MoneyErrorKind::INVALID_CONFIG);
}

TEST_F(EngineConfigTest, UnknownLogLevel)
{
    const auto config = load(R"(<Money logLevel="loud"/>)");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, MoneyErrorKind::INVALID_CONFIG);
}

TEST_F(EngineConfigTest, InvalidCurrencyPropagates)
{
    const auto config = load(
        R"(<Money><Currency id="1" code="USD" decimalPlaces="40"/></Money>)");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, MoneyErrorKind::INVALID_CURRENCY);
}

TEST_F(EngineConfigTest, DuplicateCurrency)
{
    const auto config = load(R"(<Money>
        <Currency id="1" code="USD" decimalPlaces="2"/>
        <Currency id="2" code="usd" decimalPlaces="4"/>
    </Money>)");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, MoneyErrorKind::INVALID_CONFIG);
}

TEST_F(EngineConfigTest, ApplyLogLevel)
{
    const auto config = load(R"(<Money logLevel="debug"/>)");
    ASSERT_TRUE(config.has_value()) << config.error();
    config::applyLogLevel(config.value());
    EXPECT_EQ(log::logger().level(), spdlog::level::debug);
    log::setLevel(spdlog::level::warn);
    EXPECT_EQ(log::logger().level(), spdlog::level::warn);
}

//-------------------------------------------------------------------------
