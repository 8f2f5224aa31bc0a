/*
  liquid_to_css.cpp

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

#include "liquid_to_css.h"

#include <optional>
#include <regex>

#include "settings_resolver.h"
#include "string_utils.h"
#include "template_tags.h"

namespace lqv {

namespace {

using IfBlockRewrite = std::function<std::string(const std::string& text, const TemplateTag& opener,
                                                 const TemplateTag& closer,
                                                 const std::vector<TemplateTag>& separators)>;

// Replaces every selected if/endif block (opener through matching endif) with
// the text rewrite returns. Unterminated blocks are left alone.
std::string rewrite_if_blocks(const std::string& text,
                              const std::function<bool(const TemplateTag&)>& selects,
                              const IfBlockRewrite& rewrite) {
    std::string result;
    result.reserve(text.size());
    size_t copied = 0;
    size_t pos = 0;

    while (auto tag = find_next_tag(text, pos)) {
        pos = tag->end;
        if (tag->name != "if" || !selects(*tag)) {
            continue;
        }

        std::vector<TemplateTag> separators;
        auto end = find_block_end(text, *tag, "if", "endif", {"elsif", "else"}, &separators);
        if (!end) {
            continue;
        }

        result.append(text, copied, tag->begin - copied);
        result += rewrite(text, *tag, *end, separators);
        copied = end->end;
        pos = end->end;
    }

    result.append(text, copied, std::string::npos);
    return result;
}

std::string then_branch(const std::string& text, const TemplateTag& opener,
                        const TemplateTag& closer, const std::vector<TemplateTag>& separators) {
    size_t then_end = separators.empty() ? closer.begin : separators.front().begin;
    return text.substr(opener.end, then_end - opener.end);
}

std::string keep_first_iteration_guards(const std::string& text) {
    static const std::regex first_iteration_guard(R"(^forloop\.index\s*==\s*1$)");

    return rewrite_if_blocks(
        text,
        [](const TemplateTag& tag) {
            return string_utils::starts_with(tag.markup, "forloop.index") &&
                   tag.markup.size() > std::string("forloop.index").size();
        },
        [](const std::string& source, const TemplateTag& opener, const TemplateTag& closer,
           const std::vector<TemplateTag>& separators) -> std::string {
            if (!std::regex_match(opener.markup, first_iteration_guard)) {
                return "";
            }
            return keep_first_iteration_guards(then_branch(source, opener, closer, separators));
        });
}

const std::regex& append_reference_pattern(const std::string& prefix) {
    static const std::regex scheme_pattern(
        R"(^scheme\.settings\.([\w.]+)(?:\s*\|\s*append:\s*['"]([^'"]+)['"])?$)");
    static const std::regex settings_pattern(
        R"(^settings\.([\w.]+)(?:\s*\|\s*append:\s*['"]([^'"]+)['"])?$)");
    return prefix == "scheme" ? scheme_pattern : settings_pattern;
}

}  // namespace

LiquidToCss::LiquidToCss(SettingsResolver* resolver)
    : resolver_(resolver), evaluator_(resolver), interpreter_(evaluator_), reducer_(resolver) {
    stages_ = {
        {"execute_liquid_tags", [this](const std::string& t) { return execute_liquid_tags(t); }},
        {"expand_first_color_scheme",
         [this](const std::string& t) { return expand_first_color_scheme(t); }},
        {"strip_assign_tags", [](const std::string& t) { return strip_assign_tags(t); }},
        {"reduce_static_conditionals",
         [this](const std::string& t) { return reduce_static_conditionals(t); }},
        {"take_then_branches", [](const std::string& t) { return take_then_branches(t); }},
        {"substitute_scheme_references",
         [this](const std::string& t) { return substitute_scheme_references(t); }},
        {"substitute_settings_references",
         [this](const std::string& t) { return substitute_settings_references(t); }},
        {"substitute_local_outputs",
         [](const std::string& t) { return substitute_local_outputs(t); }},
        {"strip_template_markup", [](const std::string& t) { return strip_template_markup(t); }},
    };
}

std::string LiquidToCss::transform(const std::string& block_text) const {
    std::string text = block_text;
    for (const auto& stage : stages_) {
        text = stage.apply(text);
    }
    return text;
}

std::string LiquidToCss::execute_liquid_tags(const std::string& text) const {
    return rewrite_tags(text, [this](const TemplateTag& tag) -> std::optional<std::string> {
        if (tag.name != "liquid") {
            return std::nullopt;
        }
        return interpreter_.execute(tag.markup);
    });
}

std::string LiquidToCss::expand_first_color_scheme(const std::string& text) const {
    static const std::regex scheme_loop(R"(^(\w+)\s+in\s+settings\.color_schemes$)");

    std::string result;
    result.reserve(text.size());
    size_t copied = 0;
    size_t pos = 0;

    while (auto tag = find_next_tag(text, pos)) {
        pos = tag->end;
        std::smatch match;
        if (tag->name != "for" || !std::regex_match(tag->markup, match, scheme_loop)) {
            continue;
        }
        auto end = find_block_end(text, *tag, "for", "endfor");
        if (!end) {
            continue;
        }

        result.append(text, copied, tag->begin - copied);
        result += first_iteration(match[1].str(), text.substr(tag->end, end->begin - tag->end));
        copied = end->end;
        pos = end->end;
    }

    result.append(text, copied, std::string::npos);
    return result;
}

std::string LiquidToCss::first_iteration(const std::string& loop_variable,
                                         const std::string& body) const {
    std::string scheme_id = "scheme-1";
    if (resolver_ != nullptr) {
        if (auto scheme = resolver_->first_color_scheme()) {
            scheme_id = scheme->id;
        }
    }

    std::string text =
        rewrite_outputs(body, [&](const OutputMarker& marker) -> std::optional<std::string> {
            if (marker.expression == loop_variable + ".id") {
                return scheme_id;
            }
            if (marker.expression == "forloop.index") {
                return std::string("1");
            }
            return std::nullopt;
        });
    return keep_first_iteration_guards(text);
}

std::string LiquidToCss::strip_assign_tags(const std::string& text) {
    return rewrite_tags(text, [](const TemplateTag& tag) -> std::optional<std::string> {
        if (tag.name == "assign") {
            return std::string();
        }
        return std::nullopt;
    });
}

std::string LiquidToCss::reduce_static_conditionals(const std::string& text) const {
    return reducer_.reduce(text);
}

std::string LiquidToCss::take_then_branches(const std::string& text) {
    static const std::regex generic_comparison(R"(^[\w.]+\s*[<>=!]+\s*\d+$)");

    return rewrite_if_blocks(
        text,
        [](const TemplateTag& tag) { return std::regex_match(tag.markup, generic_comparison); },
        [](const std::string& source, const TemplateTag& opener, const TemplateTag& closer,
           const std::vector<TemplateTag>& separators) {
            return take_then_branches(then_branch(source, opener, closer, separators));
        });
}

std::string LiquidToCss::substitute_scheme_references(const std::string& text) const {
    return rewrite_outputs(text, [this](const OutputMarker& marker) -> std::optional<std::string> {
        std::smatch match;
        if (!std::regex_match(marker.expression, match, append_reference_pattern("scheme"))) {
            return std::nullopt;
        }
        std::string path = match[1].str();
        std::string resolved = resolver_ != nullptr ? resolver_->resolve_scheme_reference(path)
                                                    : "[scheme." + path + "]";
        return resolved + match[2].str();
    });
}

std::string LiquidToCss::substitute_settings_references(const std::string& text) const {
    return rewrite_outputs(text, [this](const OutputMarker& marker) -> std::optional<std::string> {
        std::smatch match;
        if (!std::regex_match(marker.expression, match, append_reference_pattern("settings"))) {
            return std::nullopt;
        }
        std::string path = match[1].str();
        std::string resolved = resolver_ != nullptr ? resolver_->resolve_settings_reference(path)
                                                    : "[" + path + "]";
        return resolved + match[2].str();
    });
}

std::string LiquidToCss::substitute_local_outputs(const std::string& text) {
    static const std::regex identifier(R"(^\w+$)");
    return rewrite_outputs(text, [](const OutputMarker& marker) -> std::optional<std::string> {
        if (!std::regex_match(marker.expression, identifier)) {
            return std::nullopt;
        }
        return std::string(kLocalOutputFallback);
    });
}

std::string LiquidToCss::strip_template_markup(const std::string& text) {
    auto no_tags = rewrite_tags(text, [](const TemplateTag&) -> std::optional<std::string> {
        return std::string();
    });
    return rewrite_outputs(no_tags, [](const OutputMarker&) -> std::optional<std::string> {
        return std::string();
    });
}

}  // namespace lqv
