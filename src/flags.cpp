/*
  flags.cpp

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

#include "flags.h"

#include <getopt.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>

#include "error_out.h"
#include "lqvars.h"
#include "usage.h"

namespace flags {

namespace {

bool parse_font_size(const char* text, double& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (errno != 0 || end == text || *end != '\0' || !std::isfinite(value) || value <= 0.0) {
        return false;
    }
    out = value;
    return true;
}

}  // namespace

ParseResult parse_arguments(int argc, char* argv[]) {
    ParseResult result;

    static struct option long_options[] = {{"list", no_argument, nullptr, 'l'},
                                           {"describe", required_argument, nullptr, 'd'},
                                           {"root-only", no_argument, nullptr, 'r'},
                                           {"all-selectors", no_argument, nullptr, 'a'},
                                           {"base-font-size", required_argument, nullptr, 'b'},
                                           {"no-conversion", no_argument, nullptr, 'n'},
                                           {"config", required_argument, nullptr, 'c'},
                                           {"version", no_argument, nullptr, 'v'},
                                           {"help", no_argument, nullptr, 'h'},
                                           {nullptr, 0, nullptr, 0}};

    const char* short_options = "ld:rab:nc:vh";

    int option_index = 0;
    int c;
    optind = 1;

    while ((c = getopt_long(argc, argv, short_options, long_options, &option_index)) != -1) {
        switch (c) {
            case 'l':
                config::list_variables = true;
                config::describe_name.clear();
                break;
            case 'd':
                config::describe_name = optarg;
                config::list_variables = false;
                break;
            case 'r':
                config::only_root = true;
                break;
            case 'a':
                config::only_root = false;
                break;
            case 'b': {
                double size = 0.0;
                if (!parse_font_size(optarg, size)) {
                    print_error({ErrorType::INVALID_ARGUMENT,
                                 "--base-font-size",
                                 std::string("invalid font size '") + optarg + "'",
                                 {"Pass a positive number of pixels, for example 16"}});
                    result.exit_code = 127;
                    result.should_exit = true;
                    return result;
                }
                config::base_font_size = size;
                break;
            }
            case 'n':
                config::conversion_enabled = false;
                break;
            case 'c':
                config::config_file = optarg;
                break;
            case 'v':
                config::show_version = true;
                break;
            case 'h':
                config::show_help = true;
                break;
            case '?':
                print_usage();
                result.exit_code = 127;
                result.should_exit = true;
                return result;
            default:
                print_error({ErrorType::INVALID_ARGUMENT,
                             std::string(1, static_cast<char>(c)),
                             "Unrecognized option",
                             {"Check command line arguments"}});
                result.exit_code = 127;
                result.should_exit = true;
                return result;
        }
    }

    for (int i = optind; i < argc; i++) {
        result.folders.emplace_back(argv[i]);
    }

    return result;
}

}  // namespace flags
