// SPDX-License-Identifier: MIT
#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace wsplex {

inline constexpr std::string_view default_socket_name{".wsplex.sock"};
inline constexpr std::string_view default_pid_name{".wsplex.pid"};

// Name of the routing argument every routed tool takes.
inline constexpr std::string_view workspace_param{"workspace"};

// The two well-known files a backend leaves in its workspace directory.
struct artifact_names {
  std::string socket{default_socket_name};
  std::string pid{default_pid_name};
};

struct router_config {
  artifact_names names{};
  std::chrono::milliseconds connect_timeout{30'000};
  std::chrono::milliseconds read_timeout{30'000};
  std::chrono::milliseconds cache_ttl{10'000};
};

}  // namespace wsplex
