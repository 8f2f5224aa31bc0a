#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "parser_utils.h"
#include "template_tags.h"

TEST(TemplateTags, FindsTagAndDropsWhitespaceControl) {
    std::string text = "a {%- if settings.flag -%} b";
    auto tag = find_next_tag(text, 0);
    ASSERT_TRUE(tag.has_value());
    EXPECT_EQ(tag->name, "if");
    EXPECT_EQ(tag->markup, "settings.flag");
    EXPECT_EQ(tag->begin, 2u);
    EXPECT_EQ(text.substr(tag->end), " b");
}

TEST(TemplateTags, UnterminatedTagIsNotFound) {
    EXPECT_FALSE(find_next_tag("{% if x ", 0).has_value());
    EXPECT_FALSE(find_next_tag("plain css", 0).has_value());
}

TEST(TemplateTags, FindsTagByName) {
    std::string text = "{% assign a = 1 %}{% style %}x{% endstyle %}";
    auto tag = find_next_tag_named(text, 0, "style");
    ASSERT_TRUE(tag.has_value());
    EXPECT_EQ(tag->markup, "");
    auto end = find_next_tag_named(text, tag->end, "endstyle");
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(text.substr(tag->end, end->begin - tag->end), "x");
}

TEST(TemplateTags, OutputMarkers) {
    std::string text = "--a: {{- settings.radius -}}px; --b: {{ x }}";
    auto marker = find_next_output(text, 0);
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->expression, "settings.radius");
    auto next = find_next_output(text, marker->end);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->expression, "x");
    EXPECT_FALSE(find_next_output(text, next->end).has_value());
}

TEST(TemplateTags, BlockEndSkipsNestedBlocks) {
    std::string text =
        "{% if a %}1{% if b %}2{% else %}3{% endif %}{% elsif c %}4{% else %}5{% endif %}";
    auto opener = find_next_tag(text, 0);
    ASSERT_TRUE(opener.has_value());

    std::vector<TemplateTag> separators;
    auto end = find_block_end(text, *opener, "if", "endif", {"elsif", "else"}, &separators);
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(end->end, text.size());
    ASSERT_EQ(separators.size(), 2u);
    EXPECT_EQ(separators[0].name, "elsif");
    EXPECT_EQ(separators[0].markup, "c");
    EXPECT_EQ(separators[1].name, "else");
}

TEST(TemplateTags, UnclosedBlockHasNoEnd) {
    std::string text = "{% for x in y %}body";
    auto opener = find_next_tag(text, 0);
    ASSERT_TRUE(opener.has_value());
    EXPECT_FALSE(find_block_end(text, *opener, "for", "endfor").has_value());
}

TEST(TemplateTags, RewritesSelectedTags) {
    std::string text = "a{% assign x = 1 %}b{% comment %}c";
    std::string result = rewrite_tags(text, [](const TemplateTag& tag) -> std::optional<std::string> {
        if (tag.name == "assign") {
            return std::string();
        }
        return std::nullopt;
    });
    EXPECT_EQ(result, "ab{% comment %}c");
}

TEST(TemplateTags, RewritesOutputs) {
    std::string text = "{{ a }}-{{ b }}";
    std::string result =
        rewrite_outputs(text, [](const OutputMarker& marker) -> std::optional<std::string> {
            return "<" + marker.expression + ">";
        });
    EXPECT_EQ(result, "<a>-<b>");
}

TEST(FindMatchingBrace, CountsDepth) {
    EXPECT_EQ(find_matching_brace("a{b{c}d}e", 1), 7u);
    EXPECT_EQ(find_matching_brace("{ {}", 0), std::string::npos);
    EXPECT_EQ(find_matching_brace("abc", 0), std::string::npos);
}
