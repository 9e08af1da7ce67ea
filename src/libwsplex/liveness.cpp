// SPDX-License-Identifier: MIT
#include "wsplex/liveness.hpp"

#include <fmt/std.h>
#include <signal.h>

#include <cerrno>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>

#include "logger.hpp"

namespace wsplex {

namespace fs = std::filesystem;

std::string_view liveness_to_string(liveness state) {
  // clang-format off
  switch (state) {
  case liveness::absent: return "absent";
  case liveness::stale:  return "stale";
  case liveness::live:   return "live";
  default: return "unknown";
  }
  // clang-format on
}

std::optional<pid_t> read_marker(const fs::path& pid_path) {
  std::ifstream in{pid_path};
  if (!in) return std::nullopt;

  std::string text{std::istreambuf_iterator<char>{in}, {}};
  auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return std::nullopt;
  auto last = text.find_last_not_of(" \t\r\n");

  pid_t pid{};
  const char* begin = text.data() + first;
  const char* end = text.data() + last + 1;
  auto [ptr, ec] = std::from_chars(begin, end, pid);
  if (ec != std::errc{} || ptr != end || pid <= 0) return std::nullopt;
  return pid;
}

bool process_alive(pid_t pid) {
  if (pid <= 0) return false;
  if (::kill(pid, 0) == 0) return true;
  // Exists, but belongs to someone else
  return errno == EPERM;
}

liveness probe_backend(const fs::path& socket_path, std::string_view pid_name) {
  std::error_code ec{};
  if (!fs::exists(fs::symlink_status(socket_path, ec))) {
    return liveness::absent;
  }

  auto pid_path = socket_path.parent_path() / pid_name;
  auto pid = read_marker(pid_path);
  if (pid && process_alive(*pid)) return liveness::live;

  if (pid) {
    LOG_WARN("backend pid {} from {} is gone, cleaning up", *pid, pid_path);
  } else {
    LOG_WARN("no valid pid marker next to {}, cleaning up", socket_path);
  }
  for (const auto& p : {socket_path, pid_path}) {
    if (fs::remove(p, ec)) LOG_INFO("removed stale {}", p);
    if (ec) LOG_WARN("could not remove {}: {}", p, ec.message());
  }
  return liveness::stale;
}

}  // namespace wsplex
