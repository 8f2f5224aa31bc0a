#pragma once

#include <string>

std::string trim_trailing_whitespace(std::string s);
std::string trim_leading_whitespace(std::string s);
std::string trim_whitespace(const std::string& s);
bool is_word_char(char c);

// Index of the '}' closing the '{' at start_pos, or npos when the text ends
// first. Depth counting only: quotes and comments are not interpreted.
size_t find_matching_brace(const std::string& text, size_t start_pos);
