/*
  template_tags.cpp

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

#include "template_tags.h"

#include "parser_utils.h"

namespace {

std::string strip_whitespace_control(const std::string& inner) {
    std::string trimmed = trim_whitespace(inner);
    if (!trimmed.empty() && trimmed.front() == '-') {
        trimmed.erase(0, 1);
    }
    if (!trimmed.empty() && trimmed.back() == '-') {
        trimmed.pop_back();
    }
    return trim_whitespace(trimmed);
}

}  // namespace

std::optional<TemplateTag> find_next_tag(const std::string& text, size_t from) {
    size_t open = text.find("{%", from);
    if (open == std::string::npos) {
        return std::nullopt;
    }

    size_t close = text.find("%}", open + 2);
    if (close == std::string::npos) {
        return std::nullopt;
    }

    std::string inner = strip_whitespace_control(text.substr(open + 2, close - open - 2));

    size_t name_end = 0;
    while (name_end < inner.size() && is_word_char(inner[name_end])) {
        name_end++;
    }

    TemplateTag tag;
    tag.begin = open;
    tag.end = close + 2;
    tag.name = inner.substr(0, name_end);
    tag.markup = trim_whitespace(inner.substr(name_end));
    return tag;
}

std::optional<TemplateTag> find_next_tag_named(const std::string& text, size_t from,
                                               const std::string& name) {
    size_t pos = from;
    while (auto tag = find_next_tag(text, pos)) {
        if (tag->name == name) {
            return tag;
        }
        pos = tag->end;
    }
    return std::nullopt;
}

std::optional<OutputMarker> find_next_output(const std::string& text, size_t from) {
    size_t open = text.find("{{", from);
    while (open != std::string::npos) {
        size_t close = text.find('}', open + 2);
        if (close == std::string::npos) {
            return std::nullopt;
        }
        if (close + 1 < text.size() && text[close + 1] == '}') {
            OutputMarker marker;
            marker.begin = open;
            marker.end = close + 2;
            marker.expression =
                strip_whitespace_control(text.substr(open + 2, close - open - 2));
            return marker;
        }
        open = text.find("{{", open + 2);
    }
    return std::nullopt;
}

std::optional<TemplateTag> find_block_end(const std::string& text, const TemplateTag& opener,
                                          const std::string& open_name,
                                          const std::string& close_name,
                                          const std::vector<std::string>& separator_names,
                                          std::vector<TemplateTag>* separators) {
    int depth = 1;
    size_t pos = opener.end;
    while (auto tag = find_next_tag(text, pos)) {
        pos = tag->end;
        if (tag->name == open_name) {
            depth++;
        } else if (tag->name == close_name) {
            depth--;
            if (depth == 0) {
                return tag;
            }
        } else if (depth == 1 && separators != nullptr) {
            for (const auto& name : separator_names) {
                if (tag->name == name) {
                    separators->push_back(*tag);
                    break;
                }
            }
        }
    }
    return std::nullopt;
}

std::string rewrite_tags(
    const std::string& text,
    const std::function<std::optional<std::string>(const TemplateTag&)>& rewrite) {
    std::string result;
    result.reserve(text.size());
    size_t copied = 0;
    size_t pos = 0;
    while (auto tag = find_next_tag(text, pos)) {
        if (auto replacement = rewrite(*tag)) {
            result.append(text, copied, tag->begin - copied);
            result += *replacement;
            copied = tag->end;
        }
        pos = tag->end;
    }
    result.append(text, copied, std::string::npos);
    return result;
}

std::string rewrite_outputs(
    const std::string& text,
    const std::function<std::optional<std::string>(const OutputMarker&)>& rewrite) {
    std::string result;
    result.reserve(text.size());
    size_t copied = 0;
    size_t pos = 0;
    while (auto marker = find_next_output(text, pos)) {
        if (auto replacement = rewrite(*marker)) {
            result.append(text, copied, marker->begin - copied);
            result += *replacement;
            copied = marker->end;
        }
        pos = marker->end;
    }
    result.append(text, copied, std::string::npos);
    return result;
}
