#include <gtest/gtest.h>

#include <memory>

#include "color_utils.h"
#include "settings_loader.h"
#include "settings_resolver.h"

namespace {

std::shared_ptr<const lqv::SettingsStore> make_store(const char* current,
                                                     const char* defaults = "{}") {
    auto store = std::make_shared<lqv::SettingsStore>();
    store->current = lqv::ordered_json::parse(current);
    store->schema_defaults = lqv::ordered_json::parse(defaults);
    return store;
}

}  // namespace

// hex decoding
TEST(HexColor, DecodesThreeSixAndEightDigits) {
    auto six = lqv::decode_hex_color("#ff8000");
    ASSERT_TRUE(six.has_value());
    EXPECT_EQ(six->r, 255);
    EXPECT_EQ(six->g, 128);
    EXPECT_EQ(six->b, 0);
    EXPECT_DOUBLE_EQ(six->a, 1.0);

    auto three = lqv::decode_hex_color("#abc");
    ASSERT_TRUE(three.has_value());
    EXPECT_EQ(three->r, 0xaa);
    EXPECT_EQ(three->g, 0xbb);
    EXPECT_EQ(three->b, 0xcc);

    auto eight = lqv::decode_hex_color("#00000080");
    ASSERT_TRUE(eight.has_value());
    EXPECT_DOUBLE_EQ(eight->a, 128.0 / 255.0);
}

TEST(HexColor, RejectsBadInput) {
    EXPECT_FALSE(lqv::decode_hex_color("#12").has_value());
    EXPECT_FALSE(lqv::decode_hex_color("#zzzzzz").has_value());
    EXPECT_FALSE(lqv::decode_hex_color("#1234567").has_value());
}

TEST(HexColor, FormatsChannels) {
    EXPECT_EQ(lqv::format_rgba({255, 0, 0, 1.0}), "255, 0, 0, 1");
    EXPECT_EQ(lqv::format_rgba({255, 0, 0, 0.5}), "255, 0, 0, 0.5");
    EXPECT_EQ(lqv::format_rgb({12, 34, 56, 1.0}), "12 34 56");
}

// setting lookups
TEST(SettingsResolver, CurrentThenSchemaDefaults) {
    lqv::SettingsResolver resolver(
        make_store(R"({"radius": 14, "nested": {"size": 3}, "unset": null})",
                   R"({"gap": 8, "radius": 2, "unset": "fallback"})"));

    EXPECT_DOUBLE_EQ(resolver.get_setting("radius").number_value(), 14.0);
    EXPECT_DOUBLE_EQ(resolver.get_setting("gap").number_value(), 8.0);
    EXPECT_DOUBLE_EQ(resolver.get_setting("nested.size").number_value(), 3.0);
    EXPECT_EQ(resolver.get_setting("unset").string_value(), "fallback");
    EXPECT_TRUE(resolver.get_setting("missing").is_absent());
}

TEST(SettingsResolver, NullStoreIsEmpty) {
    lqv::SettingsResolver resolver(nullptr);
    EXPECT_TRUE(resolver.get_setting("radius").is_absent());
    EXPECT_EQ(resolver.resolve_settings_reference("radius"), "[radius]");
    EXPECT_EQ(resolver.resolve_scheme_reference("background"), "[scheme.background]");
}

TEST(SettingsResolver, SettingsReferenceText) {
    lqv::SettingsResolver resolver(make_store(
        R"({"radius": 14, "accent": "#ff0000", "fonts": {"body": "Inter"}, "list": [1, 2]})",
        R"({"spacing": 4})"));

    EXPECT_EQ(resolver.resolve_settings_reference("radius"), "14");
    EXPECT_EQ(resolver.resolve_settings_reference("fonts.body"), "Inter");
    EXPECT_EQ(resolver.resolve_settings_reference("fonts.missing"), "");
    EXPECT_EQ(resolver.resolve_settings_reference("spacing"), "4");
    EXPECT_EQ(resolver.resolve_settings_reference("nothing.here"), "[nothing.here]");
    EXPECT_EQ(resolver.resolve_settings_reference("accent"), "#ff0000");
    EXPECT_EQ(resolver.resolve_settings_reference("accent.rgba"), "255, 0, 0, 1");
    EXPECT_EQ(resolver.resolve_settings_reference("accent.rgb"), "255 0 0");
    EXPECT_EQ(resolver.resolve_settings_reference("list"), "[object]");
}

TEST(SettingsResolver, SchemeReferenceUsesFirstScheme) {
    lqv::SettingsResolver resolver(make_store(R"({
        "color_schemes": {
            "scheme-b": {"settings": {"background": "#ffffff", "opacity": 0.5}},
            "scheme-a": {"settings": {"background": "#000000"}}
        }
    })"));

    auto scheme = resolver.first_color_scheme();
    ASSERT_TRUE(scheme.has_value());
    EXPECT_EQ(scheme->id, "scheme-b");

    EXPECT_EQ(resolver.resolve_scheme_reference("background"), "255, 255, 255, 1");
    EXPECT_EQ(resolver.resolve_scheme_reference("background.rgb"), "255 255 255");
    EXPECT_EQ(resolver.resolve_scheme_reference("opacity"), "0.5");
    EXPECT_EQ(resolver.resolve_scheme_reference("missing"), "[scheme.missing]");
}

TEST(SettingsResolver, MemoizesColorsPerAlpha) {
    lqv::SettingsResolver resolver(nullptr);
    auto opaque = resolver.hex_to_rgba("#336699");
    auto faded = resolver.hex_to_rgba("#336699", 0.25);
    ASSERT_TRUE(opaque.has_value());
    ASSERT_TRUE(faded.has_value());
    EXPECT_DOUBLE_EQ(opaque->a, 1.0);
    EXPECT_DOUBLE_EQ(faded->a, 0.25);
    EXPECT_FALSE(resolver.hex_to_rgba("").has_value());
}

// settings documents
TEST(SettingsLoader, StripsCommentsAndTakesCurrent) {
    auto parsed = lqv::settings_loader::parse_settings_data(R"(/*
 * generated file
 */
{"current": {"radius": /* inline */ 6}, "presets": {}})");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value()["radius"].get<int>(), 6);
}

TEST(SettingsLoader, MissingCurrentIsEmptyObject) {
    auto parsed = lqv::settings_loader::parse_settings_data(R"({"presets": {}})");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().is_object());
    EXPECT_TRUE(parsed.value().empty());
}

TEST(SettingsLoader, MalformedDataIsAnError) {
    EXPECT_TRUE(lqv::settings_loader::parse_settings_data("{ not json").is_error());
}

TEST(SettingsLoader, FlattensSchemaSections) {
    auto parsed = lqv::settings_loader::parse_settings_schema(R"([
        {"name": "theme_info"},
        {"name": "Layout", "settings": [
            {"type": "range", "id": "page_width", "default": 1200},
            {"type": "header", "content": "Spacing"},
            {"type": "checkbox", "id": "animations"}
        ]},
        {"name": "Colors", "settings": [
            {"type": "color", "id": "accent", "default": "#121212"},
            {"type": "range", "id": "page_width", "default": 1400}
        ]}
    ])");
    ASSERT_TRUE(parsed.is_ok());
    const auto& defaults = parsed.value();
    EXPECT_EQ(defaults.size(), 2u);
    EXPECT_EQ(defaults["page_width"].get<int>(), 1400);
    EXPECT_EQ(defaults["accent"].get<std::string>(), "#121212");
}

TEST(SettingsLoader, SchemaMustBeAnArray) {
    EXPECT_TRUE(lqv::settings_loader::parse_settings_schema(R"({"settings": []})").is_error());
}

TEST(SettingsResolver, ResolvesDottedPaths) {
    auto store = make_store(R"({"fonts": {"body": {"size": 16}}, "sizes": [4, 8]})");
    EXPECT_DOUBLE_EQ(
        lqv::SettingsResolver::resolve_path(store->current, "fonts.body.size").number_value(), 16.0);
    EXPECT_DOUBLE_EQ(lqv::SettingsResolver::resolve_path(store->current, "sizes.1").number_value(),
                     8.0);
    EXPECT_TRUE(lqv::SettingsResolver::resolve_path(store->current, "fonts.mono").is_absent());

    lqv::SettingsResolver resolver(store);
    EXPECT_DOUBLE_EQ(resolver.get_setting("fonts.body.size").number_value(), 16.0);
    EXPECT_DOUBLE_EQ(resolver.get_setting("fonts.body.size").number_value(), 16.0);
}

TEST(SettingsResolver, FormatsSettingValues) {
    EXPECT_EQ(lqv::format_setting_value(lqv::ExpressionValue::from_number(1.5)), "1.5");
    EXPECT_EQ(lqv::format_setting_value(lqv::ExpressionValue::from_bool(true)), "true");
    EXPECT_EQ(lqv::format_setting_value(lqv::ExpressionValue::absent()), "");
    EXPECT_EQ(lqv::format_setting_value(lqv::ExpressionValue::from_array({})), "[object]");
}
