/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "finmoney/decimal/serialization/decimal.hpp"
#include "finmoney/serialization/msgpack_util.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <tuple>

//-------------------------------------------------------------------------

using namespace finmoney;

using namespace testing;

//-------------------------------------------------------------------------

struct DecimalSerializationTest : TestWithParam<decimal_t>
{
    virtual void SetUp() override
    {
        refValue = GetParam();
    }

    decimal_t refValue;
};

//-------------------------------------------------------------------------

TEST_P(DecimalSerializationTest, HumanReadable)
{
    serialization::HumanReadableStream stream;
    msgpack::pack(stream, refValue);
    msgpack::object_handle oh = msgpack::unpack(stream.data(), stream.size());
    msgpack::object deserialized = oh.get();
    ASSERT_EQ(deserialized.type, msgpack::type::STR);
    EXPECT_EQ(deserialized.as<decimal_t>(), refValue);
}

TEST_P(DecimalSerializationTest, Packed)
{
    serialization::BinaryStream stream;
    msgpack::pack(stream, refValue);
    msgpack::object_handle oh = msgpack::unpack(stream.data(), stream.size());
    msgpack::object deserialized = oh.get();
    ASSERT_EQ(deserialized.type, msgpack::type::BIN);
    EXPECT_EQ(deserialized.as<decimal_t>(), refValue);
}

INSTANTIATE_TEST_SUITE_P(
    DecimalSerializationTests,
    DecimalSerializationTest,
    Values(
        DEC(-293.497),
        DEC(-4.2e-18),
        DEC(3.22),
        DEC(13.37),
        DEC(6.8392581e8),
        DEC(0.000000000000000000000000001)
    ));

//-------------------------------------------------------------------------

TEST(DecimalSerializationTests, IntegersAreAccepted)
{
    msgpack::sbuffer buf;
    msgpack::pack(buf, int64_t{-42});
    msgpack::object_handle oh = msgpack::unpack(buf.data(), buf.size());
    EXPECT_EQ(oh.get().as<decimal_t>(), decimal_t{-42});
}

TEST(DecimalSerializationTests, FloatsAreRejected)
{
    msgpack::sbuffer buf;
    msgpack::pack(buf, 10.5);
    msgpack::object_handle oh = msgpack::unpack(buf.data(), buf.size());
    EXPECT_THROW(std::ignore = oh.get().as<decimal_t>(), serialization::MsgPackError);
}

TEST(DecimalSerializationTests, MalformedTextIsRejected)
{
    msgpack::sbuffer buf;
    msgpack::pack(buf, std::string{"ten"});
    msgpack::object_handle oh = msgpack::unpack(buf.data(), buf.size());
    EXPECT_THROW(std::ignore = oh.get().as<decimal_t>(), serialization::MsgPackError);
}

//-------------------------------------------------------------------------
