#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "extension_config.h"
#include "liquid_to_css.h"
#include "variable_registry.h"

namespace lqv {

// Files shorter than this are never scanned.
inline constexpr size_t kMinScannableLength = 50;

struct StyleBlock {
    enum class Kind : std::uint8_t {
        LIQUID_STYLE,
        LIQUID_STYLESHEET,
        HTML_STYLE
    };

    Kind kind;
    size_t start;
    std::string content;
};

// Finds custom property declarations in the style regions of one source
// file and records them in a registry.
class CssExtractor {
   public:
    CssExtractor(const LiquidToCss& transform, const ExtensionConfig& config);

    // Transforms every style region of text that mentions ":root" and records
    // its declarations. Returns the number of names added to registry.
    size_t parse_css_variables(const std::string& text, const std::string& file_path,
                               VariableRegistry& registry) const;

    // {% style %}, {% stylesheet %} and <style> regions containing ":root",
    // ordered by position.
    static std::vector<StyleBlock> find_style_blocks(const std::string& text);

    // echo '--name: value' statements left in plain CSS.
    static void parse_echo_variables(const std::string& css, const std::string& file_path,
                                     VariableRegistry& registry);

    // ":root { ... }" rules, optionally joined with ".a" or "#b" selectors.
    static void parse_root_blocks(const std::string& css, const std::string& file_path,
                                  VariableRegistry& registry);

    // "@media query { ... }" rules inside a root rule body.
    static void parse_media_blocks(const std::string& content, const std::string& file_path,
                                   VariableRegistry& registry);

    // ".class { ... }" rules. Never produces media variants.
    static void parse_class_blocks(const std::string& css, const std::string& file_path,
                                   VariableRegistry& registry);

    static void parse_declarations(const std::string& content, const std::string& file_path,
                                   VariableRegistry& registry,
                                   const std::optional<std::string>& media_query);

   private:
    const LiquidToCss& transform_;
    const ExtensionConfig& config_;
};

}  // namespace lqv
