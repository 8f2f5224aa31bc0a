#pragma once

#include <string>
#include <vector>

#include <cstdint>

enum class ErrorSeverity : std::uint8_t {
    INFO = 0,
    WARNING = 1,
    ERROR = 2,
    CRITICAL = 3
};

enum class ErrorType : std::uint8_t {
    FILE_NOT_FOUND,
    FILE_READ_ERROR,
    SETTINGS_PARSE_ERROR,
    CONFIG_ERROR,
    INVALID_ARGUMENT,
    VARIABLE_NOT_FOUND,
    UNKNOWN_ERROR
};

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string subject;
    std::string message;
    std::vector<std::string> suggestions;

    ErrorInfo();
    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& subj, const std::string& msg,
              const std::vector<std::string>& sugg);
    ErrorInfo(ErrorType t, const std::string& subj, const std::string& msg,
              const std::vector<std::string>& sugg);

    static ErrorSeverity get_default_severity(ErrorType type);
};

void print_error(const ErrorInfo& error);
