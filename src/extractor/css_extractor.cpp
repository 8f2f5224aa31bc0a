/*
  css_extractor.cpp

  This file is part of lqvars, a CSS custom property scanner for Liquid themes

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#include "css_extractor.h"

#include <algorithm>
#include <cctype>
#include <regex>

#include "debug.h"
#include "parser_utils.h"
#include "string_utils.h"
#include "template_tags.h"

namespace lqv {

namespace {

constexpr const char* kRootMarker = ":root";

bool is_selector_char(char c) {
    return is_word_char(c) || c == '-';
}

size_t skip_spaces(const std::string& text, size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
        pos++;
    }
    return pos;
}

// Position of the '{' opening a ":root" rule whose ":root" starts at pos,
// allowing ", .name" and ", #name" selectors in between.
std::optional<size_t> root_rule_opening(const std::string& text, size_t pos) {
    size_t i = skip_spaces(text, pos + std::string(kRootMarker).size());
    while (i < text.size() && text[i] == ',') {
        size_t j = skip_spaces(text, i + 1);
        if (j >= text.size() || (text[j] != '.' && text[j] != '#')) {
            break;
        }
        size_t name_end = j + 1;
        while (name_end < text.size() && is_selector_char(text[name_end])) {
            name_end++;
        }
        if (name_end == j + 1) {
            break;
        }
        i = skip_spaces(text, name_end);
    }
    if (i < text.size() && text[i] == '{') {
        return i;
    }
    return std::nullopt;
}

// Position of the '{' opening a ".name {" rule whose '.' is at pos.
std::optional<size_t> class_rule_opening(const std::string& text, size_t pos) {
    size_t name_end = pos + 1;
    while (name_end < text.size() && is_selector_char(text[name_end])) {
        name_end++;
    }
    if (name_end == pos + 1) {
        return std::nullopt;
    }
    size_t i = skip_spaces(text, name_end);
    if (i < text.size() && text[i] == '{') {
        return i;
    }
    return std::nullopt;
}

std::string rule_body(const std::string& text, size_t open, size_t close) {
    return text.substr(open + 1, close - open - 1);
}

void collect_liquid_blocks(const std::string& text, const std::string& open_name,
                           const std::string& close_name, StyleBlock::Kind kind,
                           std::vector<StyleBlock>& blocks) {
    size_t pos = 0;
    while (auto opener = find_next_tag_named(text, pos, open_name)) {
        if (!opener->markup.empty()) {
            pos = opener->end;
            continue;
        }
        auto closer = find_next_tag_named(text, opener->end, close_name);
        if (!closer) {
            return;
        }
        std::string content = text.substr(opener->end, closer->begin - opener->end);
        if (string_utils::contains(content, kRootMarker)) {
            blocks.push_back({kind, opener->begin, std::move(content)});
        }
        pos = closer->end;
    }
}

void collect_html_blocks(const std::string& text, std::vector<StyleBlock>& blocks) {
    const std::string lowered = string_utils::to_lower_copy(text);
    size_t pos = 0;
    while (true) {
        size_t open = lowered.find("<style", pos);
        if (open == std::string::npos) {
            return;
        }
        size_t open_end = lowered.find('>', open);
        if (open_end == std::string::npos) {
            return;
        }
        size_t close = lowered.find("</style>", open_end + 1);
        if (close == std::string::npos) {
            return;
        }
        std::string content = text.substr(open_end + 1, close - open_end - 1);
        if (string_utils::contains(content, kRootMarker)) {
            blocks.push_back({StyleBlock::Kind::HTML_STYLE, open, std::move(content)});
        }
        pos = close + std::string("</style>").size();
    }
}

}  // namespace

CssExtractor::CssExtractor(const LiquidToCss& transform, const ExtensionConfig& config)
    : transform_(transform), config_(config) {
}

size_t CssExtractor::parse_css_variables(const std::string& text, const std::string& file_path,
                                         VariableRegistry& registry) const {
    if (text.size() < kMinScannableLength || !string_utils::contains(text, kRootMarker)) {
        return 0;
    }

    auto blocks = find_style_blocks(text);
    if (blocks.empty()) {
        return 0;
    }

    size_t before = registry.size();
    for (const auto& block : blocks) {
        std::string css = transform_.transform(block.content);
        if (!string_utils::contains(css, kRootMarker)) {
            debug_msg("extract: %s block at %zu lost :root during transform", file_path.c_str(),
                      block.start);
            continue;
        }

        parse_echo_variables(css, file_path, registry);
        parse_root_blocks(css, file_path, registry);
        if (!config_.only_root) {
            parse_class_blocks(css, file_path, registry);
        }
    }

    size_t added = registry.size() - before;
    debug_msg("extract: %s -> %zu block(s), %zu new variable(s)", file_path.c_str(),
              blocks.size(), added);
    return added;
}

std::vector<StyleBlock> CssExtractor::find_style_blocks(const std::string& text) {
    std::vector<StyleBlock> blocks;
    collect_liquid_blocks(text, "style", "endstyle", StyleBlock::Kind::LIQUID_STYLE, blocks);
    collect_liquid_blocks(text, "stylesheet", "endstylesheet",
                          StyleBlock::Kind::LIQUID_STYLESHEET, blocks);
    collect_html_blocks(text, blocks);

    std::stable_sort(blocks.begin(), blocks.end(),
                     [](const StyleBlock& a, const StyleBlock& b) { return a.start < b.start; });
    return blocks;
}

void CssExtractor::parse_echo_variables(const std::string& css, const std::string& file_path,
                                        VariableRegistry& registry) {
    static const std::regex declares_variable(R"(--[\w-]+\s*:[^'"])");
    static const std::regex declaration(R"(--([\w-]+)\s*:\s*([^;]+))");
    static const std::regex interpolation(R"(\[[\w-]+\])");

    size_t pos = 0;
    while ((pos = css.find("echo", pos)) != std::string::npos) {
        size_t quote = pos + 4;
        size_t after_keyword = skip_spaces(css, quote);
        if (after_keyword == quote || after_keyword >= css.size() ||
            (css[after_keyword] != '\'' && css[after_keyword] != '"')) {
            pos++;
            continue;
        }

        size_t payload_begin = after_keyword + 1;
        size_t payload_end = css.find_first_of("'\"", payload_begin);
        if (payload_end == std::string::npos) {
            return;
        }

        std::string payload = css.substr(payload_begin, payload_end - payload_begin);
        if (!std::regex_search(payload, declares_variable)) {
            pos++;
            continue;
        }

        for (std::sregex_iterator it(payload.begin(), payload.end(), declaration), end; it != end;
             ++it) {
            std::string value = trim_whitespace((*it)[2].str());
            value = std::regex_replace(value, interpolation, "...");
            registry.record_declaration("--" + (*it)[1].str(), value, file_path);
        }
        pos = payload_end + 1;
    }
}

void CssExtractor::parse_root_blocks(const std::string& css, const std::string& file_path,
                                     VariableRegistry& registry) {
    size_t pos = 0;
    while ((pos = css.find(kRootMarker, pos)) != std::string::npos) {
        auto open = root_rule_opening(css, pos);
        if (!open) {
            pos++;
            continue;
        }
        pos = *open + 1;

        size_t close = find_matching_brace(css, *open);
        if (close == std::string::npos) {
            continue;
        }

        std::string content = rule_body(css, *open, close);
        parse_declarations(content, file_path, registry, std::nullopt);
        parse_media_blocks(content, file_path, registry);
    }
}

void CssExtractor::parse_media_blocks(const std::string& content, const std::string& file_path,
                                      VariableRegistry& registry) {
    static const std::string media_keyword = "@media";

    size_t pos = 0;
    while ((pos = content.find(media_keyword, pos)) != std::string::npos) {
        size_t query_begin = pos + media_keyword.size();
        size_t open = content.find('{', query_begin);
        if (open == std::string::npos) {
            return;
        }
        std::string query = trim_whitespace(content.substr(query_begin, open - query_begin));
        if (open == query_begin) {
            pos = query_begin;
            continue;
        }
        pos = open + 1;

        size_t close = find_matching_brace(content, open);
        if (close == std::string::npos) {
            continue;
        }
        parse_declarations(rule_body(content, open, close), file_path, registry, query);
    }
}

void CssExtractor::parse_class_blocks(const std::string& css, const std::string& file_path,
                                      VariableRegistry& registry) {
    size_t pos = 0;
    while ((pos = css.find('.', pos)) != std::string::npos) {
        auto open = class_rule_opening(css, pos);
        if (!open) {
            pos++;
            continue;
        }
        pos = *open + 1;

        size_t close = find_matching_brace(css, *open);
        if (close == std::string::npos) {
            continue;
        }

        std::string body;
        for (const auto& line : string_utils::split(rule_body(css, *open, close), "\n")) {
            std::string trimmed = trim_whitespace(line);
            if (string_utils::starts_with(trimmed, "/*") ||
                string_utils::starts_with(trimmed, "@media")) {
                continue;
            }
            body += line;
            body += '\n';
        }
        parse_declarations(body, file_path, registry, std::nullopt);
    }
}

void CssExtractor::parse_declarations(const std::string& content, const std::string& file_path,
                                      VariableRegistry& registry,
                                      const std::optional<std::string>& media_query) {
    static const std::regex declaration(R"(--([\w-]+)\s*:\s*([^;]+);)");

    for (const auto& line : string_utils::split(content, "\n")) {
        if (!string_utils::contains(line, "--")) {
            continue;
        }
        for (std::sregex_iterator it(line.begin(), line.end(), declaration), end; it != end;
             ++it) {
            registry.record_declaration("--" + (*it)[1].str(), trim_whitespace((*it)[2].str()),
                                        file_path, media_query);
        }
    }
}

}  // namespace lqv
