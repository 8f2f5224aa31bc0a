#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// A "{% name markup %}" tag located in raw template text. Whitespace-control
// dashes ("{%-", "-%}") are accepted and dropped from the markup.
struct TemplateTag {
    size_t begin = 0;
    size_t end = 0;
    std::string name;
    std::string markup;
};

// A "{{ expression }}" output marker. The expression never contains '}'.
struct OutputMarker {
    size_t begin = 0;
    size_t end = 0;
    std::string expression;
};

std::optional<TemplateTag> find_next_tag(const std::string& text, size_t from);

std::optional<TemplateTag> find_next_tag_named(const std::string& text, size_t from,
                                               const std::string& name);

std::optional<OutputMarker> find_next_output(const std::string& text, size_t from);

// The tag closing the block opened at opener: scans forward counting nested
// open_name / close_name pairs. Intermediate tags named in separators (for
// example "elsif" and "else") are collected into *separators when they sit
// at the opener's own nesting level.
std::optional<TemplateTag> find_block_end(const std::string& text, const TemplateTag& opener,
                                          const std::string& open_name,
                                          const std::string& close_name,
                                          const std::vector<std::string>& separator_names = {},
                                          std::vector<TemplateTag>* separators = nullptr);

// Copies text, replacing each tag for which rewrite returns a value.
std::string rewrite_tags(
    const std::string& text,
    const std::function<std::optional<std::string>(const TemplateTag&)>& rewrite);

// Copies text, replacing each output marker for which rewrite returns a value.
std::string rewrite_outputs(
    const std::string& text,
    const std::function<std::optional<std::string>(const OutputMarker&)>& rewrite);
