#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>

#include "wsplex/config.hpp"

namespace fs = std::filesystem;

namespace wsplex {

struct transport_options {
  std::string transport{"stdio"};
  std::string address{"127.0.0.1"};
  int port{3000};
  int threads{4};
  std::optional<fs::path> tools_file{};
};

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, wsplex::transport_options& topts,
    wsplex::router_config& config);
}  // namespace wsplex
