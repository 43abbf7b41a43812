/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/money/Money.hpp"
#include "finmoney/serialization/json_util.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

//-------------------------------------------------------------------------

using namespace finmoney;
using namespace finmoney::literals;

using namespace testing;

//-------------------------------------------------------------------------

TEST(MoneyJsonTests, AmountIsWrittenAsString)
{
    rapidjson::Document json;
    Money{DEC(10.50), Currency::USD}.jsonSerialize(json);
    EXPECT_EQ(
        json::json2str(json),
        R"({"amount":"10.50","currency":{"id":1,"code":"USD","name":"US Dollar","decimalPlaces":2}})");
}

TEST(MoneyJsonTests, SerializeUnderKey)
{
    rapidjson::Document json;
    json.SetObject();
    Money{DEC(0.25), Currency::EUR}.jsonSerialize(json, "price");
    ASSERT_TRUE(json.HasMember("price"));
    EXPECT_STREQ(json["price"]["amount"].GetString(), "0.25");
    EXPECT_STREQ(json["price"]["currency"]["code"].GetString(), "EUR");
}

TEST(MoneyJsonTests, RoundTripIsExact)
{
    const Money refMoney{DEC(-1234.567890123456789012345678), Currency::ETH};
    rapidjson::Document json;
    refMoney.jsonSerialize(json);

    const auto restored = Money::fromJson(json);
    ASSERT_TRUE(restored.has_value()) << restored.error();
    EXPECT_EQ(restored.value(), refMoney);
    EXPECT_EQ(restored->decimalPlaces(), 18u);
}

TEST(MoneyJsonTests, IntegerAmountAccepted)
{
    rapidjson::Document json;
    json.Parse(R"({"amount":42,"currency":{"id":6,"code":"JPY","name":null,"decimalPlaces":0}})");
    const auto money = Money::fromJson(json);
    ASSERT_TRUE(money.has_value()) << money.error();
    EXPECT_EQ(money.value(), Money(42_dec, Currency::JPY));
}

//-------------------------------------------------------------------------

struct MoneyJsonRejectionTestParams
{
    std::string json;
    MoneyErrorKind refKind;
};

void PrintTo(const MoneyJsonRejectionTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.json = {}, .refKind = {}}}", params.json, magic_enum::enum_name(params.refKind));
}

struct MoneyJsonRejectionTest : TestWithParam<MoneyJsonRejectionTestParams> {};

TEST_P(MoneyJsonRejectionTest, IsRejected)
{
    const auto& [text, refKind] = GetParam();
    rapidjson::Document json;
    json.Parse(text.c_str());
    const auto money = Money::fromJson(json);
    ASSERT_FALSE(money.has_value());
    EXPECT_EQ(money.error().kind, refKind);
}

INSTANTIATE_TEST_SUITE_P(
    MoneyJsonTests,
    MoneyJsonRejectionTest,
    Values(
        MoneyJsonRejectionTestParams{
            R"({"amount":10.5,"currency":{"id":1,"code":"USD","decimalPlaces":2}})",
            MoneyErrorKind::INVALID_AMOUNT},
        MoneyJsonRejectionTestParams{
            R"({"amount":"ten","currency":{"id":1,"code":"USD","decimalPlaces":2}})",
            MoneyErrorKind::INVALID_AMOUNT},
        MoneyJsonRejectionTestParams{
            R"({"amount":"Infinity","currency":{"id":1,"code":"USD","decimalPlaces":2}})",
            MoneyErrorKind::INVALID_AMOUNT},
        MoneyJsonRejectionTestParams{
            R"({"amount":"1.0000000000000000000000000000000000001","currency":{"id":1,"code":"USD","decimalPlaces":2}})",
            MoneyErrorKind::INVALID_AMOUNT},
        MoneyJsonRejectionTestParams{
            R"({"currency":{"id":1,"code":"USD","decimalPlaces":2}})",
            MoneyErrorKind::INVALID_AMOUNT},
        MoneyJsonRejectionTestParams{R"([1, 2])", MoneyErrorKind::INVALID_AMOUNT},
        MoneyJsonRejectionTestParams{
            R"({"amount":"1","currency":{"id":1,"code":"USD","decimalPlaces":40}})",
            MoneyErrorKind::INVALID_CURRENCY},
        MoneyJsonRejectionTestParams{
            R"({"amount":"1","currency":"USD"})",
            MoneyErrorKind::INVALID_CURRENCY}
    ));

//-------------------------------------------------------------------------
