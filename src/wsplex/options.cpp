#include "options.hpp"

#include <CLI/CLI.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace wsplex {

namespace {

// Ten days: far beyond any useful timeout, well inside milliseconds' range
constexpr double max_seconds{10.0 * 24 * 60 * 60};

std::chrono::milliseconds to_ms(double seconds) {
  return std::chrono::milliseconds{static_cast<long long>(seconds * 1000.0)};
}

}  // namespace

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel,
    wsplex::transport_options& topts,
    wsplex::router_config& config) {
  CLI::App app{
    "Route tool calls to per-workspace backends over Unix sockets"};

  double connect_timeout{30.0};
  double read_timeout{30.0};
  double cache_ttl{10.0};
  std::string tools_file{};

  app.add_option(
      "--transport", topts.transport,
      "Front-end transport")
    ->check(CLI::IsMember({"stdio", "http"}))
    ->capture_default_str();
  app.add_option(
      "--port", topts.port,
      "Port for HTTP mode")
    ->check(CLI::Range(1, 65535))
    ->capture_default_str();
  app.add_option(
      "--address", topts.address,
      "Bind address for HTTP mode")
    ->capture_default_str();
  app.add_option(
      "--threads", topts.threads,
      "Worker threads")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  app.add_option(
      "--connect-timeout", connect_timeout,
      "Seconds to wait for a backend connection")
    ->check(CLI::PositiveNumber)
    ->check(CLI::Range(0.0, max_seconds))
    ->capture_default_str();
  app.add_option(
      "--read-timeout", read_timeout,
      "Seconds to wait for a backend response")
    ->check(CLI::PositiveNumber)
    ->check(CLI::Range(0.0, max_seconds))
    ->capture_default_str();
  app.add_option(
      "--cache-ttl", cache_ttl,
      "Seconds a socket lookup stays cached")
    ->check(CLI::Range(0.0, max_seconds))
    ->capture_default_str();
  app.add_option(
      "--socket-name", config.names.socket,
      "Well-known backend socket filename")
    ->capture_default_str();
  app.add_option(
      "--pid-name", config.names.pid,
      "Well-known backend pid marker filename")
    ->capture_default_str();
  app.add_option(
      "--tools",
      tools_file,
      "JSON tool registry (default: built-in tools)")
    ->check(CLI::ExistingFile);
  app.add_option(
      "-d, --debug",
      loglevel,
      "Debug log level (3=INFO)")
    ->capture_default_str();

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  config.connect_timeout = to_ms(connect_timeout);
  config.read_timeout = to_ms(read_timeout);
  config.cache_ttl = to_ms(cache_ttl);
  if (!tools_file.empty()) topts.tools_file = fs::path{tools_file};

  return std::nullopt;
}

}  // namespace wsplex
