#include <gtest/gtest.h>

#include <memory>

#include "liquid_to_css.h"
#include "settings_resolver.h"

namespace {

class LiquidToCssTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto store = std::make_shared<lqv::SettingsStore>();
        store->current = lqv::ordered_json::parse(R"({
            "radius": 14,
            "accent": "#ff0000",
            "show_badge": false,
            "color_schemes": {
                "scheme-a": {"settings": {"background": "#ffffff", "text": "#000000"}},
                "scheme-b": {"settings": {"background": "#111111", "text": "#eeeeee"}}
            }
        })");
        resolver = std::make_unique<lqv::SettingsResolver>(store);
        transform = std::make_unique<lqv::LiquidToCss>(resolver.get());
    }

    std::unique_ptr<lqv::SettingsResolver> resolver;
    std::unique_ptr<lqv::LiquidToCss> transform;
};

}  // namespace

TEST_F(LiquidToCssTest, SubstitutesSettingsOutputs) {
    EXPECT_EQ(transform->transform(":root { --button-radius: {{ settings.radius }}px; }"),
              ":root { --button-radius: 14px; }");
    EXPECT_EQ(transform->transform("--r: {{ settings.radius | append: 'px' }};"), "--r: 14px;");
    EXPECT_EQ(transform->transform("--c: rgba({{ settings.accent.rgba }});"),
              "--c: rgba(255, 0, 0, 1);");
    EXPECT_EQ(transform->transform("--m: {{ settings.missing }};"), "--m: [missing];");
}

TEST_F(LiquidToCssTest, ExpandsFirstColorScheme) {
    std::string text =
        "{% for scheme in settings.color_schemes %}"
        ".color-{{ scheme.id }} { --bg: {{ scheme.settings.background.rgb }}; }"
        "{% endfor %}";
    EXPECT_EQ(transform->transform(text), ".color-scheme-a { --bg: 255 255 255; }");
}

TEST_F(LiquidToCssTest, KeepsOnlyFirstIterationGuards) {
    std::string text =
        "{% for scheme in settings.color_schemes %}"
        "{% if forloop.index == 1 %}:root { {% endif %}"
        "{% if forloop.index > 1 %}.later { {% endif %}"
        "--i: {{ forloop.index }}; }"
        "{% endfor %}";
    EXPECT_EQ(transform->execute_liquid_tags(text), text);
    EXPECT_EQ(transform->expand_first_color_scheme(text), ":root { --i: 1; }");
}

TEST_F(LiquidToCssTest, ExecutesLiquidTags) {
    std::string text =
        ":root { {% liquid\n"
        "  assign r = settings.radius\n"
        "  echo '--r: ' | append: r | append: 'px;'\n"
        "%} }";
    EXPECT_EQ(transform->transform(text), ":root { --r: 14px; }");
}

TEST_F(LiquidToCssTest, StripsAssignTags) {
    EXPECT_EQ(lqv::LiquidToCss::strip_assign_tags("a{% assign x = 1 %}b{%- assign y = 2 -%}c"),
              "abc");
}

TEST_F(LiquidToCssTest, ReducesSettingsConditionals) {
    std::string text =
        "{% if settings.show_badge %}--badge: 1;{% else %}--badge: 0;{% endif %}";
    EXPECT_EQ(transform->transform(text), "--badge: 0;");
}

TEST_F(LiquidToCssTest, GenericConditionTakesThenBranch) {
    std::string text = "{% if opacity > 0 %}--o: 1;{% else %}--o: 0;{% endif %}";
    EXPECT_EQ(lqv::LiquidToCss::take_then_branches(text), "--o: 1;");
    EXPECT_EQ(transform->transform(text), "--o: 1;");
}

TEST_F(LiquidToCssTest, LocalOutputsUseFallback) {
    EXPECT_EQ(transform->transform("--shadow-opacity: {{ opacity_5_15 }};"),
              "--shadow-opacity: 0.15;");
}

TEST_F(LiquidToCssTest, StripsLeftoverMarkup) {
    EXPECT_EQ(transform->transform("a{% render 'x' %}b{{ product.title | upcase }}c"), "abc");
}

TEST_F(LiquidToCssTest, StagesRunInOrder) {
    const auto& stages = transform->stages();
    ASSERT_EQ(stages.size(), 9u);
    EXPECT_STREQ(stages.front().name, "execute_liquid_tags");
    EXPECT_STREQ(stages.back().name, "strip_template_markup");
}

TEST(LiquidToCss, WorksWithoutSettings) {
    lqv::LiquidToCss transform(nullptr);
    EXPECT_EQ(transform.transform("--r: {{ settings.radius }}px;"), "--r: [radius]px;");
    EXPECT_EQ(transform.transform("{% for s in settings.color_schemes %}.{{ s.id }}{% endfor %}"),
              ".scheme-1");
}
