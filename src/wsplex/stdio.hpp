#pragma once

#include <unistd.h>

#include <cstddef>

#include "wsplex/jsonrpc.hpp"

namespace wsplex {

class dispatcher;

// Serve newline-delimited JSONRPC read from in_fd, writing each response as
// one line to out_fd.  Every input line is dispatched as its own task on a
// pool of `threads` threads, so a slow backend never holds up the lines
// read after it.  A line longer than max_line is answered with an
// Invalid Request error and skipped.  Returns once in_fd reaches EOF and
// every dispatched request has been answered.
void run_stdio_server(
    dispatcher& router, int threads, int in_fd = STDIN_FILENO,
    int out_fd = STDOUT_FILENO,
    std::size_t max_line = jsonrpc::max_line_length);

}  // namespace wsplex
