#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <memory>
#include <string>

#include "lqv_filesystem.h"
#include "variable_scanner.h"
#include "workspace.h"

namespace fs = lqv_filesystem::fs;

namespace {

const char* kThemeStyles =
    "{% style %}\n"
    ":root {\n"
    "  --button-radius: {{ settings.radius }}px;\n"
    "  --page-width: 1200px;\n"
    "}\n"
    "{% endstyle %}\n";

std::shared_ptr<const lqv::SettingsStore> store_with_radius(int radius) {
    auto store = std::make_shared<lqv::SettingsStore>();
    store->current = lqv::ordered_json{{"radius", radius}};
    return store;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

}  // namespace

TEST(VariableScanner, StartsEmpty) {
    lqv::VariableScanner scanner;
    EXPECT_TRUE(scanner.registry()->empty());
    EXPECT_TRUE(scanner.settings()->empty());
    EXPECT_EQ(scanner.source_file_count(), 0u);
    EXPECT_FALSE(scanner.lookup("--anything").has_value());
}

TEST(VariableScanner, RescanReplacesSnapshot) {
    lqv::VariableScanner scanner;
    lqv::ExtensionConfig config;

    std::vector<lqv::SourceFile> sources = {{"snippets/theme-styles.liquid", kThemeStyles}};
    EXPECT_EQ(scanner.rescan(sources, store_with_radius(14), config), 2u);

    auto first = scanner.registry();
    auto radius = scanner.lookup("--button-radius");
    ASSERT_TRUE(radius.has_value());
    EXPECT_EQ(radius->value, "14px");

    EXPECT_EQ(scanner.rescan(sources, store_with_radius(20), config), 2u);
    EXPECT_EQ(scanner.lookup("--button-radius")->value, "20px");
    EXPECT_EQ(first->find("--button-radius")->value, "14px");
    EXPECT_EQ(scanner.settings()->current["radius"].get<int>(), 20);
}

TEST(VariableScanner, RemovedSourcesDisappear) {
    lqv::VariableScanner scanner;
    lqv::ExtensionConfig config;

    std::string other =
        "<style>\n:root {\n  --other-gap: 4px;\n  --other-line: 1.4;\n}\n</style>\n";
    scanner.rescan({{"a.liquid", kThemeStyles}, {"b.liquid", other}}, nullptr, config);
    EXPECT_EQ(scanner.source_file_count(), 2u);
    EXPECT_EQ(scanner.lookup("--button-radius")->value, "[radius]px");

    scanner.rescan({{"b.liquid", other}}, nullptr, config);
    EXPECT_EQ(scanner.source_file_count(), 1u);
    EXPECT_FALSE(scanner.lookup("--button-radius").has_value());
    EXPECT_TRUE(scanner.lookup("--other-gap").has_value());
}

TEST(MatchesGlob, DoubleStarSpansDirectories) {
    EXPECT_TRUE(lqv::matches_glob("**/*.liquid", "theme.liquid"));
    EXPECT_TRUE(lqv::matches_glob("**/*.liquid", "snippets/a/b.liquid"));
    EXPECT_FALSE(lqv::matches_glob("**/*.liquid", "assets/base.css"));
    EXPECT_TRUE(lqv::matches_glob("**/snippets/theme-styles-*.liquid",
                                  "snippets/theme-styles-variables.liquid"));
    EXPECT_FALSE(lqv::matches_glob("**/snippets/theme-styles-*.liquid", "sections/theme-styles-a.liquid"));
    EXPECT_TRUE(lqv::matches_glob("**/node_modules/**", "node_modules/pkg/index.liquid"));
    EXPECT_TRUE(lqv::matches_glob("**/node_modules/**", "a/node_modules/x.liquid"));
    EXPECT_FALSE(lqv::matches_glob("sections/*.liquid", "sections/sub/x.liquid"));
}

class WorkspaceTest : public ::testing::Test {
   protected:
    void SetUp() override {
        root = fs::temp_directory_path() /
               ("lqvars_workspace_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        write_file(root / "config" / "settings_data.json",
                   "/*\n * settings\n */\n{\"current\": {\"radius\": 6}}");
        write_file(root / "config" / "settings_schema.json",
                   R"([{"name": "Layout", "settings": [{"id": "page_width", "default": 1200}]}])");
        write_file(root / "snippets" / "vars.liquid", kThemeStyles);
        write_file(root / "node_modules" / "pkg" / "vars.liquid",
                   "<style>\n:root {\n  --from-node-modules: 1px;\n  --more: 2px;\n}\n</style>\n");
        write_file(root / "assets" / "base.css",
                   "<style>\n:root {\n  --from-css-file: 1px;\n  --more: 2px;\n}\n</style>\n");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path root;
};

TEST_F(WorkspaceTest, DiscoversIncludedFilesOnly) {
    lqv::Workspace workspace({root.string()}, lqv::ExtensionConfig{});
    auto files = workspace.discover_files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(fs::path(files[0]).filename().string(), "vars.liquid");
    EXPECT_NE(files[0].find("snippets"), std::string::npos);
}

TEST_F(WorkspaceTest, RescanUsesWorkspaceSettings) {
    lqv::Workspace workspace({root.string()}, lqv::ExtensionConfig{});
    lqv::VariableScanner scanner;

    EXPECT_EQ(workspace.rescan(scanner), 2u);
    EXPECT_EQ(scanner.lookup("--button-radius")->value, "6px");
    EXPECT_FALSE(scanner.lookup("--from-node-modules").has_value());
    EXPECT_EQ(scanner.settings()->schema_defaults["page_width"].get<int>(), 1200);
}

TEST_F(WorkspaceTest, MissingFolderIsSkipped) {
    lqv::Workspace workspace({(root / "missing").string(), root.string()},
                             lqv::ExtensionConfig{});
    EXPECT_EQ(workspace.discover_files().size(), 1u);
}

TEST_F(WorkspaceTest, UnreadableFilesAreLeftOut) {
    lqv::Workspace workspace({root.string()}, lqv::ExtensionConfig{});
    auto sources = workspace.read_sources({(root / "snippets" / "vars.liquid").string(),
                                           (root / "gone.liquid").string()});
    ASSERT_EQ(sources.size(), 1u);
    EXPECT_EQ(sources[0].content, kThemeStyles);
}
