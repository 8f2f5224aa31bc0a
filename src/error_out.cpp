/*
  error_out.cpp

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

#include "error_out.h"

#include <iostream>
#include <string>
#include <vector>

void print_error(const ErrorInfo& error) {
    std::cerr << "lqvars: ";

    switch (error.severity) {
        case ErrorSeverity::INFO:
            std::cerr << "info: ";
            break;
        case ErrorSeverity::WARNING:
            std::cerr << "warning: ";
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
        default:
            break;
    }

    if (!error.subject.empty()) {
        std::cerr << error.subject << ": ";
    }

    switch (error.type) {
        case ErrorType::FILE_NOT_FOUND:
            std::cerr << "file not found";
            break;
        case ErrorType::FILE_READ_ERROR:
            std::cerr << "read error";
            break;
        case ErrorType::SETTINGS_PARSE_ERROR:
            std::cerr << "settings parse error";
            break;
        case ErrorType::CONFIG_ERROR:
            std::cerr << "configuration error";
            break;
        case ErrorType::INVALID_ARGUMENT:
            std::cerr << "invalid argument";
            break;
        case ErrorType::VARIABLE_NOT_FOUND:
            std::cerr << "variable not found";
            break;
        case ErrorType::UNKNOWN_ERROR:
        default:
            std::cerr << "unknown error";
            break;
    }

    if (!error.message.empty()) {
        std::cerr << ": " << error.message;
    }

    std::cerr << '\n';

    for (const auto& suggestion : error.suggestions) {
        std::cerr << suggestion << '\n';
    }
}

ErrorInfo::ErrorInfo()
    : type(ErrorType::UNKNOWN_ERROR),
      severity(ErrorSeverity::ERROR),
      subject(""),
      message(""),
      suggestions() {
}

ErrorInfo::ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& subj,
                     const std::string& msg, const std::vector<std::string>& sugg)
    : type(t), severity(s), subject(subj), message(msg), suggestions(sugg) {
}

ErrorInfo::ErrorInfo(ErrorType t, const std::string& subj, const std::string& msg,
                     const std::vector<std::string>& sugg)
    : type(t), severity(get_default_severity(t)), subject(subj), message(msg), suggestions(sugg) {
}

ErrorSeverity ErrorInfo::get_default_severity(ErrorType type) {
    switch (type) {
        case ErrorType::FILE_NOT_FOUND:
            return ErrorSeverity::WARNING;
        case ErrorType::FILE_READ_ERROR:
            return ErrorSeverity::WARNING;
        case ErrorType::SETTINGS_PARSE_ERROR:
            return ErrorSeverity::WARNING;
        case ErrorType::CONFIG_ERROR:
            return ErrorSeverity::WARNING;
        case ErrorType::INVALID_ARGUMENT:
            return ErrorSeverity::CRITICAL;
        case ErrorType::VARIABLE_NOT_FOUND:
            return ErrorSeverity::ERROR;
        case ErrorType::UNKNOWN_ERROR:
        default:
            return ErrorSeverity::ERROR;
    }
}
