#pragma once

void print_usage();
