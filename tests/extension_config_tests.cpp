#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "extension_config.h"

using lqv::ExtensionConfig;

namespace {

std::string write_temp_file(const std::string& name, const std::string& content) {
    auto path = lqv_filesystem::fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

}  // namespace

TEST(ExtensionConfig, Defaults) {
    ExtensionConfig config;
    ASSERT_EQ(config.include_patterns.size(), 3u);
    EXPECT_EQ(config.include_patterns[0], "**/*.liquid");
    ASSERT_EQ(config.exclude_patterns.size(), 1u);
    EXPECT_EQ(config.exclude_patterns[0], "**/node_modules/**");
    EXPECT_TRUE(config.rem_to_px_conversion);
    EXPECT_DOUBLE_EQ(config.base_font_size, 16.0);
    EXPECT_TRUE(config.only_root);
}

TEST(ExtensionConfig, AppliesKnownOptions) {
    ExtensionConfig config;
    int applied = config.apply_json(nlohmann::json::parse(R"({
        "includePatterns": ["sections/*.liquid"],
        "remToPxConversion": false,
        "baseFontSize": 10,
        "onlyRoot": false,
        "unrelated": 1
    })"));
    EXPECT_EQ(applied, 4);
    ASSERT_EQ(config.include_patterns.size(), 1u);
    EXPECT_EQ(config.include_patterns[0], "sections/*.liquid");
    EXPECT_EQ(config.exclude_patterns.size(), 1u);
    EXPECT_FALSE(config.rem_to_px_conversion);
    EXPECT_DOUBLE_EQ(config.base_font_size, 10.0);
    EXPECT_FALSE(config.only_root);
}

TEST(ExtensionConfig, SkipsWrongTypes) {
    ExtensionConfig config;
    int applied = config.apply_json(nlohmann::json::parse(R"({
        "excludePatterns": ["ok", 3],
        "baseFontSize": "16px",
        "onlyRoot": "yes"
    })"));
    EXPECT_EQ(applied, 0);
    EXPECT_EQ(config.exclude_patterns[0], "**/node_modules/**");
    EXPECT_DOUBLE_EQ(config.base_font_size, 16.0);
    EXPECT_TRUE(config.only_root);

    EXPECT_EQ(config.apply_json(nlohmann::json::array()), 0);
}

TEST(ExtensionConfig, RejectsNonPositiveFontSize) {
    ExtensionConfig config;
    EXPECT_EQ(config.apply_json(nlohmann::json::parse(R"({"baseFontSize": 0})")), 0);
    EXPECT_EQ(config.apply_json(nlohmann::json::parse(R"({"baseFontSize": -4})")), 0);
    EXPECT_DOUBLE_EQ(config.base_font_size, 16.0);
    EXPECT_EQ(config.apply_json(nlohmann::json::parse(R"({"baseFontSize": 12.5})")), 1);
    EXPECT_DOUBLE_EQ(config.base_font_size, 12.5);
}

TEST(ExtensionConfig, LoadsFile) {
    std::string path = write_temp_file("lqvars_config_test.json", R"({"baseFontSize": 20})");
    ExtensionConfig config;
    auto result = config.load_file(path);
    EXPECT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(config.base_font_size, 20.0);
    std::remove(path.c_str());
}

TEST(ExtensionConfig, LoadFileErrors) {
    ExtensionConfig config;
    EXPECT_TRUE(config.load_file("/nonexistent/lqvars/.lqvars.json").is_error());

    std::string path = write_temp_file("lqvars_config_bad.json", "{ nope");
    auto result = config.load_file(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("Invalid JSON"), std::string::npos);
    std::remove(path.c_str());
}
