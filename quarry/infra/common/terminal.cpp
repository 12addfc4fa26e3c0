// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <unistd.h>

#include <cstdio>

namespace quarry {

bool is_terminal(int fd) {
    return isatty(fd);
}

bool is_terminal_stdout() {
    return is_terminal(fileno(stdout));
}

bool is_terminal_stderr() {
    return is_terminal(fileno(stderr));
}

}  // namespace quarry
