/*
  usage.cpp

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

#include "usage.h"

#include <iostream>

#include "lqvars.h"

void print_usage() {
    std::cout << "lqvars " << get_version() << "\n"
              << "Lists the CSS custom properties declared by a Liquid theme\n"
              << "Usage: lqvars [options] [workspace_folder...]\n"
              << "\n"
              << "Options:\n"
              << "  -l, --list                 List every variable (default)\n"
              << "  -d, --describe=NAME        Show value, source, media variants and\n"
              << "                             unit conversion of one variable\n"
              << "  -r, --root-only            Only read :root rules\n"
              << "  -a, --all-selectors        Also read .class rules\n"
              << "  -b, --base-font-size=N     Pixels per rem for conversions (default 16)\n"
              << "  -n, --no-conversion        Disable rem/px conversion hints\n"
              << "  -c, --config=FILE          Read options from FILE instead of\n"
              << "                             <workspace>/.lqvars.json\n"
              << "  -v, --version              Show version information and exit\n"
              << "  -h, --help                 Display this help message and exit\n"
              << "\n"
              << "Examples:\n"
              << "  lqvars                     Scan the current directory\n"
              << "  lqvars -d button-radius    Describe --button-radius\n"
              << "  lqvars -a theme/ shared/   Scan two folders, all selectors\n"
              << "\n";
}
