#include "openmtl/mtl_value.h"

#include <gtest/gtest.h>

#include <cmath>
#include <string>

namespace openmtl {

TEST(MtlValueTest, CastsIntegersFirst)
{
    const MtlValue v = cast_to_best("44");
    ASSERT_TRUE(v.is_int());
    EXPECT_EQ(v.i64, 44);

    EXPECT_EQ(cast_to_best("-7").as_int(), -7);
    EXPECT_EQ(cast_to_best("+12").as_int(), 12);
    EXPECT_EQ(cast_to_best("0").as_int(99), 0);
}


TEST(MtlValueTest, FallsBackToFloat)
{
    const MtlValue v = cast_to_best("38.50313");
    ASSERT_TRUE(v.is_float());
    EXPECT_DOUBLE_EQ(v.f64, 38.50313);

    EXPECT_DOUBLE_EQ(cast_to_best("1e3").as_float(), 1000.0);
    EXPECT_DOUBLE_EQ(cast_to_best("-0.5").as_float(), -0.5);
    EXPECT_TRUE(cast_to_best("2.5E-04").is_float());
}


TEST(MtlValueTest, IntegerOverflowBecomesFloat)
{
    const MtlValue v = cast_to_best("99999999999999999999");
    ASSERT_TRUE(v.is_float());
    EXPECT_GT(v.f64, 9.9e18);
}


TEST(MtlValueTest, TextStripsOneQuotePair)
{
    const MtlValue v = cast_to_best("\"LANDSAT_8\"");
    ASSERT_TRUE(v.is_text());
    EXPECT_EQ(v.text, "LANDSAT_8");

    EXPECT_EQ(cast_to_best("\"\"nested\"\"").as_text(), "\"nested\"");
    EXPECT_EQ(cast_to_best("\"").as_text(), "\"");
    EXPECT_EQ(cast_to_best("\"open").as_text(), "\"open");
    EXPECT_EQ(cast_to_best("UTM").as_text(), "UTM");
}


TEST(MtlValueTest, QuotedNumbersStayText)
{
    const MtlValue v = cast_to_best("\"42\"");
    ASSERT_TRUE(v.is_text());
    EXPECT_EQ(v.text, "42");
}


TEST(MtlValueTest, DatesAndTimesAreText)
{
    EXPECT_TRUE(cast_to_best("2015-03-12").is_text());
    EXPECT_TRUE(cast_to_best("18:46:33.5810010Z").is_text());
    EXPECT_TRUE(cast_to_best("12abc").is_text());
    EXPECT_TRUE(cast_to_best("++1").is_text());
}


TEST(MtlValueTest, TypedAccessorsReturnFallbackOnKindMismatch)
{
    const MtlValue text = make_text("abc");
    EXPECT_EQ(text.as_int(-1), -1);
    EXPECT_DOUBLE_EQ(text.as_float(2.0), 2.0);
    EXPECT_EQ(make_int(3).as_text("none"), "none");
    EXPECT_DOUBLE_EQ(make_int(3).as_float(), 3.0);

    const MtlValue empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.as_int(5), 5);
}


TEST(MtlValueTest, EqualityComparesKindAndPayload)
{
    EXPECT_TRUE(make_int(4) == make_int(4));
    EXPECT_FALSE(make_int(4) == make_float(4.0));
    EXPECT_FALSE(make_text("4") == make_int(4));
    EXPECT_TRUE(make_text("a") == make_text("a"));
    EXPECT_TRUE(MtlValue {} == MtlValue {});
}


TEST(MtlValueTest, AppendsCanonicalStrings)
{
    std::string s;
    append_value_string(make_int(-12), &s);
    s.push_back('|');
    append_value_string(make_float(0.25), &s);
    s.push_back('|');
    append_value_string(make_text("OLI_TIRS"), &s);
    s.push_back('|');
    append_value_string(MtlValue {}, &s);
    EXPECT_EQ(s, "-12|0.25|OLI_TIRS|");
}

}  // namespace openmtl
