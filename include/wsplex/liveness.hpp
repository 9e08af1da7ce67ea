// SPDX-License-Identifier: MIT
#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "wsplex/config.hpp"

namespace wsplex {

namespace fs = std::filesystem;

enum class liveness : uint8_t {
  absent,  // no socket file, the backend was never started
  stale,   // socket file left behind by a dead backend
  live,    // socket file and a marker naming a running process
};

std::string_view liveness_to_string(liveness state);

// Decimal process id stored in the marker file at @p pid_path, if any.
std::optional<pid_t> read_marker(const fs::path& pid_path);

// Whether the OS reports @p pid as an existing process.
bool process_alive(pid_t pid);

// Classify the backend behind @p socket_path from the socket file and the
// marker file named @p pid_name next to it.  A stale outcome removes both
// artifacts before returning.
liveness probe_backend(
    const fs::path& socket_path, std::string_view pid_name = default_pid_name);

inline bool is_live(
    const fs::path& socket_path, std::string_view pid_name = default_pid_name) {
  return probe_backend(socket_path, pid_name) == liveness::live;
}

}  // namespace wsplex
