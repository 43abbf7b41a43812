/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/money/Money.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <tuple>

//-------------------------------------------------------------------------

using namespace finmoney;
using namespace finmoney::literals;

using namespace testing;

//-------------------------------------------------------------------------

struct ToTickTestParams
{
    decimal_t amount;
    decimal_t tick;
    RoundingStrategy strategy;
    decimal_t refAmount;
};

void PrintTo(const ToTickTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.amount = {}, .tick = {}, .strategy = {}, .refAmount = {}}}",
        params.amount,
        params.tick,
        magic_enum::enum_name(params.strategy),
        params.refAmount);
}

struct ToTickTest : TestWithParam<ToTickTestParams> {};

TEST_P(ToTickTest, WorksCorrectly)
{
    const auto [amount, tick, strategy, refAmount] = GetParam();
    const auto snapped = Money{amount, Currency::USD}.toTick(tick, strategy);
    ASSERT_TRUE(snapped.has_value());
    EXPECT_EQ(snapped->amount(), refAmount);
    EXPECT_EQ(snapped->currency(), Currency::USD);
}

INSTANTIATE_TEST_SUITE_P(
    Nearest,
    ToTickTest,
    Values(
        ToTickTestParams{
            DEC(10.567), DEC(0.25), RoundingStrategy::MIDPOINT_NEAREST_EVEN, DEC(10.50)},
        ToTickTestParams{
            DEC(10.567), DEC(0.10), RoundingStrategy::MIDPOINT_NEAREST_EVEN, DEC(10.60)},
        ToTickTestParams{
            DEC(10.567), DEC(0.01), RoundingStrategy::MIDPOINT_NEAREST_EVEN, DEC(10.57)},
        ToTickTestParams{
            DEC(10.567), DEC(0.001), RoundingStrategy::MIDPOINT_NEAREST_EVEN, DEC(10.567)},
        ToTickTestParams{
            DEC(10.567), 1_dec, RoundingStrategy::MIDPOINT_NEAREST_EVEN, 11_dec},
        ToTickTestParams{
            DEC(-10.567), DEC(0.25), RoundingStrategy::MIDPOINT_NEAREST_EVEN, DEC(-10.50)},
        ToTickTestParams{
            DEC(1234.56), 100_dec, RoundingStrategy::MIDPOINT_NEAREST_EVEN, 1200_dec},
        ToTickTestParams{
            DEC(10.70), DEC(0.25), RoundingStrategy::MIDPOINT_NEAREST_EVEN, DEC(10.75)},
        ToTickTestParams{
            DEC(0.0), DEC(0.25), RoundingStrategy::MIDPOINT_NEAREST_EVEN, DEC(0.0)}
    ));

INSTANTIATE_TEST_SUITE_P(
    Midpoints,
    ToTickTest,
    Values(
        ToTickTestParams{
            DEC(10.625), DEC(0.25), RoundingStrategy::MIDPOINT_NEAREST_EVEN, DEC(10.50)},
        ToTickTestParams{
            DEC(10.875), DEC(0.25), RoundingStrategy::MIDPOINT_NEAREST_EVEN, 11_dec},
        ToTickTestParams{
            DEC(10.625), DEC(0.25), RoundingStrategy::MIDPOINT_AWAY_FROM_ZERO, DEC(10.75)},
        ToTickTestParams{
            DEC(10.625), DEC(0.25), RoundingStrategy::MIDPOINT_TOWARD_ZERO, DEC(10.50)},
        ToTickTestParams{
            DEC(-10.625), DEC(0.25), RoundingStrategy::MIDPOINT_AWAY_FROM_ZERO, DEC(-10.75)},
        ToTickTestParams{
            DEC(7.5), 5_dec, RoundingStrategy::MIDPOINT_NEAREST_EVEN, 10_dec},
        ToTickTestParams{
            DEC(12.5), 5_dec, RoundingStrategy::MIDPOINT_NEAREST_EVEN, 10_dec}
    ));

INSTANTIATE_TEST_SUITE_P(
    Directional,
    ToTickTest,
    Values(
        ToTickTestParams{DEC(10.567), DEC(0.25), RoundingStrategy::FLOOR, DEC(10.50)},
        ToTickTestParams{DEC(10.567), DEC(0.25), RoundingStrategy::CEILING, DEC(10.75)},
        ToTickTestParams{DEC(-10.567), DEC(0.25), RoundingStrategy::FLOOR, DEC(-10.75)},
        ToTickTestParams{DEC(-10.567), DEC(0.25), RoundingStrategy::CEILING, DEC(-10.50)},
        ToTickTestParams{DEC(10.567), DEC(0.25), RoundingStrategy::TO_ZERO, DEC(10.50)},
        ToTickTestParams{DEC(10.501), DEC(0.25), RoundingStrategy::AWAY_FROM_ZERO, DEC(10.75)},
        ToTickTestParams{DEC(10.561), DEC(0.01), RoundingStrategy::CEILING, DEC(10.57)},
        ToTickTestParams{DEC(0.9), DEC(0.33), RoundingStrategy::FLOOR, DEC(0.66)}
    ));

//-------------------------------------------------------------------------

TEST(TickTests, NamedVariants)
{
    const Money price{DEC(10.567), Currency::USD};
    EXPECT_THAT(price.toTickNearest(DEC(0.25)), Optional(Money{DEC(10.50), Currency::USD}));
    EXPECT_THAT(price.toTickDown(DEC(0.25)), Optional(Money{DEC(10.50), Currency::USD}));
    EXPECT_THAT(price.toTickUp(DEC(0.25)), Optional(Money{DEC(10.75), Currency::USD}));
}

TEST(TickTests, ResultIsNotRoundedToCurrencyPlaces)
{
    const Money price{DEC(10.5678), Currency::USD};
    EXPECT_THAT(price.toTickNearest(DEC(0.005)), Optional(Money{DEC(10.57), Currency::USD}));
    EXPECT_THAT(price.toTickDown(DEC(0.0025)), Optional(Money{DEC(10.5675), Currency::USD}));
}

TEST(TickTests, InvalidTickSize)
{
    const Money price{DEC(10.567), Currency::USD};
    for (const decimal_t tick : {0_dec, DEC(-0.25), -1_dec}) {
        const auto snapped = price.toTickNearest(tick);
        ASSERT_FALSE(snapped.has_value());
        EXPECT_EQ(snapped.error().kind, MoneyErrorKind::INVALID_TICK_SIZE);
        EXPECT_EQ(price.toTickDown(tick).error().kind, MoneyErrorKind::INVALID_TICK_SIZE);
        EXPECT_EQ(price.toTickUp(tick).error().kind, MoneyErrorKind::INVALID_TICK_SIZE);
        EXPECT_FALSE(price.isMultipleOfTick(tick));
    }
}

TEST(TickTests, IsMultipleOfTick)
{
    EXPECT_TRUE(Money(DEC(10.50), Currency::USD).isMultipleOfTick(DEC(0.25)));
    EXPECT_FALSE(Money(DEC(10.567), Currency::USD).isMultipleOfTick(DEC(0.25)));
    EXPECT_TRUE(Money(1200_dec, Currency::USD).isMultipleOfTick(100_dec));
    EXPECT_TRUE(Money::zero(Currency::USD).isMultipleOfTick(DEC(0.33)));
    EXPECT_TRUE(Money(DEC(-0.99), Currency::USD).isMultipleOfTick(DEC(0.33)));
}

//-------------------------------------------------------------------------

struct TickPropertyTest : TestWithParam<std::tuple<decimal_t, decimal_t>> {};

TEST_P(TickPropertyTest, SnapsOntoLatticeAndBracketsAmount)
{
    const auto [amount, tick] = GetParam();
    const Money price{amount, Currency::USD};

    const auto nearest = price.toTickNearest(tick);
    const auto down = price.toTickDown(tick);
    const auto up = price.toTickUp(tick);
    ASSERT_TRUE(nearest.has_value());
    ASSERT_TRUE(down.has_value());
    ASSERT_TRUE(up.has_value());

    EXPECT_TRUE(nearest->isMultipleOfTick(tick));
    EXPECT_TRUE(down->isMultipleOfTick(tick));
    EXPECT_TRUE(up->isMultipleOfTick(tick));

    EXPECT_THAT(nearest->toTickNearest(tick), Optional(nearest.value()));

    EXPECT_TRUE(down->isLessThanOrEqualDecimal(amount));
    EXPECT_TRUE(up->isGreaterThanOrEqualDecimal(amount));
    EXPECT_TRUE(up->amount() - down->amount() <= tick);
}

INSTANTIATE_TEST_SUITE_P(
    TickTests,
    TickPropertyTest,
    Combine(
        Values(DEC(10.567), DEC(-10.567), DEC(0.0), DEC(1234.56), DEC(0.01), DEC(-0.125)),
        Values(DEC(0.25), DEC(0.01), DEC(0.001), 1_dec, DEC(0.33), 5_dec, DEC(0.0001))));

//-------------------------------------------------------------------------

struct TickDecimalPlacesTestParams
{
    decimal_t tick;
    std::optional<uint32_t> refPlaces;
};

void PrintTo(const TickDecimalPlacesTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.tick = {}, .refPlaces = {}}}",
        params.tick,
        params.refPlaces.has_value() ? fmt::format("{}", params.refPlaces.value()) : "nullopt");
}

struct TickDecimalPlacesTest : TestWithParam<TickDecimalPlacesTestParams> {};

TEST_P(TickDecimalPlacesTest, WorksCorrectly)
{
    const auto [tick, refPlaces] = GetParam();
    EXPECT_EQ(Money::tickDecimalPlaces(tick), refPlaces);
}

INSTANTIATE_TEST_SUITE_P(
    TickTests,
    TickDecimalPlacesTest,
    Values(
        TickDecimalPlacesTestParams{.tick = DEC(0.001), .refPlaces = 3},
        TickDecimalPlacesTestParams{.tick = DEC(0.01), .refPlaces = 2},
        TickDecimalPlacesTestParams{.tick = DEC(0.1), .refPlaces = 1},
        TickDecimalPlacesTestParams{.tick = DEC(0.10), .refPlaces = 1},
        TickDecimalPlacesTestParams{.tick = 1_dec, .refPlaces = 0},
        TickDecimalPlacesTestParams{.tick = DEC(0.25), .refPlaces = std::nullopt},
        TickDecimalPlacesTestParams{.tick = DEC(0.33), .refPlaces = std::nullopt},
        TickDecimalPlacesTestParams{.tick = 5_dec, .refPlaces = std::nullopt},
        TickDecimalPlacesTestParams{.tick = 10_dec, .refPlaces = std::nullopt},
        TickDecimalPlacesTestParams{.tick = 0_dec, .refPlaces = std::nullopt}
    ));

//-------------------------------------------------------------------------
