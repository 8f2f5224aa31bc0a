/*
  quote_info.cpp

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

#include "quote_info.h"

#include "parser_utils.h"

std::vector<std::string> split_unquoted(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    current.reserve(text.size());
    char quote_char = '\0';

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if ((c == '"' || c == '\'') && !is_char_escaped(text, i)) {
            if (quote_char == '\0') {
                quote_char = c;
            } else if (c == quote_char) {
                quote_char = '\0';
            }
            current += c;
        } else if (c == delimiter && quote_char == '\0') {
            parts.push_back(trim_whitespace(current));
            current.clear();
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        parts.push_back(trim_whitespace(current));
    }

    return parts;
}

std::string strip_outer_quotes(const std::string& text) {
    std::string result = text;
    if (!result.empty() && (result.front() == '\'' || result.front() == '"')) {
        result.erase(0, 1);
    }
    if (!result.empty() && (result.back() == '\'' || result.back() == '"')) {
        result.pop_back();
    }
    return result;
}

QuoteInfo::QuoteInfo(const std::string& token)
    : is_single(is_single_quoted_token(token)),
      is_double(is_double_quoted_token(token)),
      value(is_single || is_double ? token.substr(1, token.size() - 2) : token) {
}

bool QuoteInfo::is_unquoted() const {
    return !is_single && !is_double;
}

bool QuoteInfo::is_single_quoted_token(const std::string& s) {
    return s.size() >= 2 && s.front() == '\'' && s.back() == '\'';
}

bool QuoteInfo::is_double_quoted_token(const std::string& s) {
    return s.size() >= 2 && s.front() == '"' && s.back() == '"';
}
