#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ColumnDecoders.hpp"
#include <cmath>
#include <limits>

using namespace pqrow;
using ::testing::HasSubstr;

class ColumnDecodersTest : public ::testing::Test {
};

// Value parsers
TEST_F(ColumnDecodersTest, TextKeepsBytes) {
    auto result = textValue()("hello world");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value(), "hello world");

    EXPECT_EQ(textValue()("").value(), "");
}

TEST_F(ColumnDecodersTest, BoolAcceptsPostgresForms) {
    EXPECT_TRUE(boolValue()("t").value());
    EXPECT_TRUE(boolValue()("true").value());
    EXPECT_TRUE(boolValue()("TRUE").value());
    EXPECT_FALSE(boolValue()("f").value());
    EXPECT_FALSE(boolValue()("false").value());
}

TEST_F(ColumnDecodersTest, BoolRejectsOtherText) {
    auto result = boolValue()("yes");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "invalid bool 'yes'");
}

TEST_F(ColumnDecodersTest, IntegersParseWholeString) {
    EXPECT_EQ(int32Value()("42").value(), 42);
    EXPECT_EQ(int32Value()("-17").value(), -17);
    EXPECT_EQ(int64Value()("9223372036854775807").value(),
              std::numeric_limits<int64_t>::max());
    EXPECT_EQ(int16Value()("-32768").value(), -32768);
}

TEST_F(ColumnDecodersTest, IntegersRejectGarbage) {
    EXPECT_EQ(int32Value()("abc").error(), "invalid int4 'abc'");
    EXPECT_FALSE(int32Value()("12abc").ok());
    EXPECT_FALSE(int32Value()("").ok());
    EXPECT_FALSE(int32Value()(" 12").ok());
    EXPECT_FALSE(int32Value()("1.5").ok());
}

TEST_F(ColumnDecodersTest, IntegersRejectOutOfRange) {
    EXPECT_EQ(int16Value()("40000").error(), "int2 out of range '40000'");
    EXPECT_FALSE(int32Value()("2147483648").ok());
    EXPECT_TRUE(int32Value()("2147483647").ok());
    EXPECT_FALSE(int64Value()("9223372036854775808").ok());
}

TEST_F(ColumnDecodersTest, FloatingPoint) {
    EXPECT_DOUBLE_EQ(float8Value()("3.25").value(), 3.25);
    EXPECT_FLOAT_EQ(float4Value()("-0.5").value(), -0.5f);
    EXPECT_TRUE(std::isnan(float8Value()("NaN").value()));
    EXPECT_TRUE(std::isinf(float8Value()("Infinity").value()));
    EXPECT_TRUE(std::isinf(float8Value()("-Infinity").value()));
}

TEST_F(ColumnDecodersTest, FloatingPointRejectsGarbage) {
    EXPECT_EQ(float8Value()("1.2.3").error(), "invalid float8 '1.2.3'");
    EXPECT_FALSE(float4Value()("").ok());
    EXPECT_FALSE(float4Value()("1e100").ok());
}

// NULL handling
TEST_F(ColumnDecodersTest, NotNullRejectsNull) {
    auto decoder = notNull(int32Value());

    EXPECT_EQ(decoder(Cell("5")).value(), 5);
    auto result = decoder(std::nullopt);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "unexpected NULL");
}

TEST_F(ColumnDecodersTest, NullableMapsNullToNothing) {
    auto decoder = nullable(int32Value());

    auto null = decoder(std::nullopt);
    ASSERT_TRUE(null.ok());
    EXPECT_FALSE(null.value().has_value());

    auto present = decoder(Cell("9"));
    ASSERT_TRUE(present.ok());
    EXPECT_EQ(present.value(), std::optional<int32_t>(9));
}

TEST_F(ColumnDecodersTest, NullableStillRejectsBadValues) {
    auto result = nullable(int32Value())(Cell("x"));
    ASSERT_FALSE(result.ok());
    EXPECT_THAT(result.error(), HasSubstr("'x'"));
}

// DecodeResult
TEST_F(ColumnDecodersTest, DecodeResultAccessorsGuardMisuse) {
    auto failure = DecodeResult<int>::failure("bad");
    EXPECT_THROW(failure.value(), std::logic_error);
    EXPECT_FALSE(static_cast<bool>(failure));

    auto success = DecodeResult<int>::success(1);
    EXPECT_THROW(success.error(), std::logic_error);
    EXPECT_TRUE(static_cast<bool>(success));
}

TEST_F(ColumnDecodersTest, DecodeResultMapAndContext) {
    auto doubled = DecodeResult<int>::success(21).map([](int v) { return v * 2; });
    EXPECT_EQ(doubled.value(), 42);

    auto failed = DecodeResult<int>::failure("bad").map([](int v) { return v * 2; });
    EXPECT_EQ(failed.error(), "bad");

    auto context = DecodeResult<int>::failure("bad").withContext("column 3");
    EXPECT_EQ(context.error(), "column 3: bad");
}
