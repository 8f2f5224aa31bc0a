#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace lqv_filesystem {
namespace fs = std::filesystem;

struct Error {
    std::string message;
    explicit Error(const std::string& msg) : message(msg) {
    }
};

template <typename T>
class Result {
   public:
    explicit Result(T value) : value_(std::move(value)), has_value_(true) {
    }
    explicit Result(const Error& error) : error_(error.message), has_value_(false) {
    }

    static Result<T> ok(T value) {
        return Result<T>(std::move(value));
    }
    static Result<T> error(const std::string& message) {
        return Result<T>(Error(message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const T& value() const {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    T& value() {
        if (!has_value_)
            throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

   private:
    T value_{};
    std::string error_;
    bool has_value_;
};

template <>
class Result<void> {
   public:
    Result() : has_value_(true) {
    }
    explicit Result(const Error& error) : error_(error.message), has_value_(false) {
    }

    static Result<void> ok() {
        return Result<void>();
    }
    static Result<void> error(const std::string& message) {
        return Result<void>(Error(message));
    }

    bool is_ok() const {
        return has_value_;
    }
    bool is_error() const {
        return !has_value_;
    }

    const std::string& error() const {
        if (has_value_)
            throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

   private:
    std::string error_;
    bool has_value_;
};

Result<int> safe_open(const std::string& path, int flags);
void safe_close(int fd);

Result<std::string> read_file_content(const std::string& path);

bool file_exists(const fs::path& path);

// Walks root recursively and returns regular files as paths relative to root,
// using '/' separators. Unreadable subdirectories are skipped.
Result<std::vector<std::string>> list_files_recursive(const fs::path& root);

std::string base_name(const std::string& path);

}  // namespace lqv_filesystem
