#include <gtest/gtest.h>

#include "extension_config.h"
#include "unit_conversion.h"

using lqv::ExtensionConfig;

// fixed-point formatting
TEST(ToFixed, RoundsHalfUpOnExactValue) {
    EXPECT_EQ(lqv::to_fixed(0.125, 2), "0.13");
    EXPECT_EQ(lqv::to_fixed(1.005, 2), "1.00");
    EXPECT_EQ(lqv::to_fixed(2.5, 0), "3");
    EXPECT_EQ(lqv::to_fixed(9.995, 1), "10.0");
    EXPECT_EQ(lqv::to_fixed(-1.5, 0), "-2");
    EXPECT_EQ(lqv::to_fixed(0.0, 4), "0.0000");
}

TEST(UnitConversion, RemToPx) {
    EXPECT_EQ(lqv::rem_to_px("1.5rem").value_or(""), "24");
    EXPECT_EQ(lqv::rem_to_px("0.0625").value_or(""), "1");
    EXPECT_EQ(lqv::rem_to_px("1", 10.0).value_or(""), "10");
    EXPECT_EQ(lqv::rem_to_px("0.3333").value_or(""), "5.33");
    EXPECT_FALSE(lqv::rem_to_px("auto").has_value());
}

TEST(UnitConversion, PxToRem) {
    EXPECT_EQ(lqv::px_to_rem("24").value_or(""), "1.5");
    EXPECT_EQ(lqv::px_to_rem("10px").value_or(""), "0.625");
    EXPECT_EQ(lqv::px_to_rem("1").value_or(""), "0.0625");
    EXPECT_EQ(lqv::px_to_rem("5").value_or(""), "0.3125");
    EXPECT_FALSE(lqv::px_to_rem("").has_value());
}

TEST(UnitConversion, PxRemRoundTrip) {
    for (const char* px : {"4", "8", "12", "24", "40"}) {
        auto rem = lqv::px_to_rem(px);
        ASSERT_TRUE(rem.has_value());
        EXPECT_EQ(lqv::rem_to_px(*rem).value_or(""), px);
    }
}

TEST(ConversionHint, RemTakesPrecedence) {
    ExtensionConfig config;
    EXPECT_EQ(lqv::conversion_hint("1.5rem", config).value_or(""), "24px");
    EXPECT_EQ(lqv::conversion_hint(" 24px ", config).value_or(""), "1.5rem");
    EXPECT_EQ(lqv::conversion_hint("calc(1rem + 2px)", config).value_or(""), "16px");
    EXPECT_FALSE(lqv::conversion_hint("red", config).has_value());
}

TEST(ConversionHint, FollowsConfig) {
    ExtensionConfig config;
    config.base_font_size = 10.0;
    EXPECT_EQ(lqv::conversion_hint("2rem", config).value_or(""), "20px");

    config.rem_to_px_conversion = false;
    EXPECT_FALSE(lqv::conversion_hint("2rem", config).has_value());
}

TEST(DescribeVariable, ListsValueSourceVariantsAndHint) {
    lqv::CssVariableEntry entry;
    entry.name = "--page-gap";
    entry.value = "1rem";
    entry.file = "theme-styles-variables.liquid";
    entry.file_path = "snippets/theme-styles-variables.liquid";
    entry.media.push_back({"(min-width: 750px)", "2rem"});

    EXPECT_EQ(lqv::describe_variable(entry, ExtensionConfig{}),
              "CSS Variable: --page-gap\n"
              "Value: 1rem\n"
              "Source: theme-styles-variables.liquid (snippets/theme-styles-variables.liquid)\n"
              "Media Query Variants:\n"
              "  @media (min-width: 750px): 2rem\n"
              "Convert to px: 16px\n");
}

TEST(DescribeVariable, PlainValue) {
    lqv::CssVariableEntry entry;
    entry.name = "--color-text";
    entry.value = "0 0 0";
    entry.file = "vars.liquid";
    entry.file_path = "vars.liquid";

    EXPECT_EQ(lqv::describe_variable(entry, ExtensionConfig{}),
              "CSS Variable: --color-text\n"
              "Value: 0 0 0\n"
              "Source: vars.liquid\n");
}
