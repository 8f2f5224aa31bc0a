#pragma once

#include <string>
#include <vector>

inline bool is_char_escaped(const std::string& str, size_t pos) {
    if (pos == 0 || pos > str.size())
        return false;
    size_t backslash_count = 0;
    size_t i = pos - 1;
    while (true) {
        if (str[i] == '\\') {
            ++backslash_count;
            if (i == 0)
                break;
            --i;
        } else {
            break;
        }
    }
    return (backslash_count % 2) == 1;
}

// Splits text on delimiter occurrences that are outside single or double
// quotes. Segments are trimmed; a trailing empty segment is dropped.
std::vector<std::string> split_unquoted(const std::string& text, char delimiter);

// Removes one leading and one trailing quote character, independently.
std::string strip_outer_quotes(const std::string& text);

struct QuoteInfo {
    bool is_single;
    bool is_double;
    std::string value;

    explicit QuoteInfo(const std::string& token);

    bool is_unquoted() const;

   private:
    static bool is_single_quoted_token(const std::string& s);
    static bool is_double_quoted_token(const std::string& s);
};
