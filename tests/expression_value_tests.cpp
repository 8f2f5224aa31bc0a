#include <gtest/gtest.h>

#include <cmath>

#include "expression_value.h"

using lqv::ExpressionValue;

// canonical output text of each kind
TEST(ExpressionValueOutput, RendersEachKind) {
    EXPECT_EQ(ExpressionValue::absent().to_output_string(), "");
    EXPECT_EQ(ExpressionValue::from_number(14).to_output_string(), "14");
    EXPECT_EQ(ExpressionValue::from_number(1.5).to_output_string(), "1.5");
    EXPECT_EQ(ExpressionValue::from_bool(true).to_output_string(), "true");
    EXPECT_EQ(ExpressionValue::from_string("abc").to_output_string(), "abc");

    ExpressionValue::Array items = {ExpressionValue::from_string("a"),
                                    ExpressionValue::from_number(2)};
    EXPECT_EQ(ExpressionValue::from_array(items).to_output_string(), "a,2");
    EXPECT_EQ(ExpressionValue::from_object({}).to_output_string(), "[object]");
}

TEST(ExpressionValueOutput, FormatsNumbersShortest) {
    EXPECT_EQ(lqv::format_number(0.1 + 0.2), "0.30000000000000004");
    EXPECT_EQ(lqv::format_number(-3), "-3");
    EXPECT_EQ(lqv::format_number(std::nan("")), "NaN");
    EXPECT_EQ(lqv::format_number(INFINITY), "Infinity");
}

// leading-number parse versus whole-string conversion
TEST(ExpressionValueCoercion, FloatAndNumberDiffer) {
    EXPECT_DOUBLE_EQ(ExpressionValue::from_string("14px").to_float(), 14.0);
    EXPECT_TRUE(std::isnan(ExpressionValue::from_string("14px").to_number()));
    EXPECT_TRUE(std::isnan(ExpressionValue::from_string("abc").to_float()));
    EXPECT_DOUBLE_EQ(ExpressionValue::from_string("").to_number(), 0.0);
    EXPECT_DOUBLE_EQ(ExpressionValue::from_bool(true).to_number(), 1.0);
    EXPECT_TRUE(std::isnan(ExpressionValue::absent().to_float()));
}

TEST(ExpressionValueCoercion, Truthiness) {
    EXPECT_FALSE(ExpressionValue::absent().is_truthy());
    EXPECT_FALSE(ExpressionValue::from_string("").is_truthy());
    EXPECT_FALSE(ExpressionValue::from_number(0).is_truthy());
    EXPECT_FALSE(ExpressionValue::from_number(std::nan("")).is_truthy());
    EXPECT_FALSE(ExpressionValue::from_bool(false).is_truthy());
    EXPECT_TRUE(ExpressionValue::from_string("0").is_truthy());
    EXPECT_TRUE(ExpressionValue::from_array({}).is_truthy());
}

TEST(ExpressionValueEquality, LooseEqualityCoercesPrimitives) {
    EXPECT_TRUE(ExpressionValue::from_number(1).loose_equals(ExpressionValue::from_string("1")));
    EXPECT_TRUE(ExpressionValue::from_bool(true).loose_equals(ExpressionValue::from_number(1)));
    EXPECT_TRUE(ExpressionValue::absent().loose_equals(ExpressionValue::absent()));
    EXPECT_FALSE(ExpressionValue::absent().loose_equals(ExpressionValue::from_string("")));
    EXPECT_FALSE(ExpressionValue::from_string("a").loose_equals(ExpressionValue::from_string("b")));
}

TEST(ExpressionValueEquality, StrictEqualityRequiresSameKind) {
    EXPECT_FALSE(ExpressionValue::from_number(1).strict_equals(ExpressionValue::from_string("1")));
    EXPECT_TRUE(ExpressionValue::from_string("x").strict_equals(ExpressionValue::from_string("x")));
    EXPECT_TRUE(ExpressionValue::from_number(std::nan(""))
                    .strict_equals(ExpressionValue::from_number(std::nan(""))));
}

TEST(ExpressionValueMembers, ObjectLookup) {
    ExpressionValue::Object members;
    members["index"] = ExpressionValue::from_number(3);
    ExpressionValue object = ExpressionValue::from_object(members);

    EXPECT_TRUE(object.has_member("index"));
    EXPECT_DOUBLE_EQ(object.member("index").number_value(), 3.0);
    EXPECT_TRUE(object.member("missing").is_absent());
    EXPECT_TRUE(ExpressionValue::from_string("x").member("index").is_absent());
}
