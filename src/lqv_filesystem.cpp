/*
  lqv_filesystem.cpp

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

#include "lqv_filesystem.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <system_error>

namespace lqv_filesystem {

Result<int> safe_open(const std::string& path, int flags) {
    int fd = ::open(path.c_str(), flags);
    if (fd == -1) {
        return Result<int>::error("Failed to open file '" + path +
                                  "': " + std::string(strerror(errno)));
    }
    return Result<int>::ok(fd);
}

void safe_close(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

Result<std::string> read_file_content(const std::string& path) {
    auto open_result = safe_open(path, O_RDONLY);
    if (open_result.is_error()) {
        return Result<std::string>::error(open_result.error());
    }

    int fd = open_result.value();
    std::string content;
    char buffer[4096];
    ssize_t bytes_read;

    while ((bytes_read = read(fd, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, static_cast<size_t>(bytes_read));
    }

    safe_close(fd);

    if (bytes_read < 0) {
        return Result<std::string>::error("Failed to read from file '" + path +
                                          "': " + std::string(strerror(errno)));
    }

    return Result<std::string>::ok(content);
}

bool file_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

Result<std::vector<std::string>> list_files_recursive(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Result<std::vector<std::string>>::error("Not a directory: '" + root.string() +
                                                       "'");
    }

    std::vector<std::string> files;
    auto options = fs::directory_options::skip_permission_denied;
    fs::recursive_directory_iterator it(root, options, ec);
    if (ec) {
        return Result<std::vector<std::string>>::error("Failed to walk '" + root.string() +
                                                       "': " + ec.message());
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        files.push_back(it->path().lexically_relative(root).generic_string());
    }

    std::sort(files.begin(), files.end());
    return Result<std::vector<std::string>>::ok(files);
}

std::string base_name(const std::string& path) {
    return fs::path(path).filename().string();
}

}  // namespace lqv_filesystem
