// Demo backend: serves a handful of text tools for one workspace until
// SIGINT/SIGTERM.
#include <fmt/std.h>

#include <CLI/CLI.hpp>
#include <algorithm>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/json.hpp>
#include <cctype>
#include <csignal>
#include <exception>
#include <filesystem>
#include <map>
#include <string>

#include "../libwsplex/logger.hpp"
#include "wsplex/backend_host.hpp"
#include "wsplex/tools.hpp"

namespace fs = std::filesystem;
namespace json = boost::json;
namespace net = boost::asio;

namespace {

std::string text_arg(const json::object& args) {
  if (auto* v = args.if_contains("text")) {
    if (auto* s = v->if_string()) return {s->data(), s->size()};
  }
  return {};
}

std::map<std::string, wsplex::tool_fn> demo_tools() {
  static std::atomic<long> counter{0};
  std::map<std::string, wsplex::tool_fn> tools;
  tools["echo"] = [](const json::object& args) { return text_arg(args); };
  tools["upper"] = [](const json::object& args) {
    auto s = text_arg(args);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });
    return s;
  };
  tools["reverse"] = [](const json::object& args) {
    auto s = text_arg(args);
    std::reverse(s.begin(), s.end());
    return s;
  };
  tools["counter"] = [](const json::object&) {
    return std::to_string(++counter);
  };
  return tools;
}

}  // namespace

int main(int argc, char* argv[]) {
  fs::path workspace{fs::current_path()};
  wsplex::artifact_names names{};
  int loglevel{3};

  CLI::App app{"Serve demo tools for one wsplex workspace"};
  app.add_option("--workspace", workspace, "Workspace directory")
      ->check(CLI::ExistingDirectory)
      ->capture_default_str();
  app.add_option("--socket-name", names.socket, "Socket filename")
      ->capture_default_str();
  app.add_option("--pid-name", names.pid, "Pid marker filename")
      ->capture_default_str();
  app.add_option("-d, --debug", loglevel, "Debug log level (3=INFO)")
      ->capture_default_str();
  CLI11_PARSE(app, argc, argv);

  wsplex::logger::set_level(static_cast<wsplex::logger::level>(loglevel));
  std::signal(SIGPIPE, SIG_IGN);

  try {
    wsplex::backend_host host{fs::absolute(workspace), demo_tools(), names};
    host.start();
    fmt::print(stderr, "wsplex-backend: serving {}\n", host.socket_path());

    net::io_context ioc;
    net::signal_set signals{ioc, SIGINT, SIGTERM};
    signals.async_wait([](const boost::system::error_code&, int signo) {
      LOG_INFO("signal {}, stopping", signo);
    });
    ioc.run();
    host.stop();
    return 0;
  } catch (const wsplex::config_error& e) {
    LOG_FATAL("{}", e.what());
    return 2;
  } catch (const std::exception& e) {
    LOG_FATAL("{}", e.what());
    return 1;
  }
}
