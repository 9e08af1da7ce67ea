#include <fmt/chrono.h>
#include <fmt/std.h>

#include <csignal>
#include <exception>
#include <span>
#include <utility>

#include "../libwsplex/logger.hpp"
#include "options.hpp"
#include "stdio.hpp"
#include "web.hpp"
#include "wsplex/dispatcher.hpp"
#include "wsplex/tools.hpp"

int main(int argc, char* argv[]) {
  wsplex::router_config config{};
  wsplex::transport_options topts{};
  int loglevel{3};

  auto done =
      wsplex::parse_options(std::span(argv, argc), loglevel, topts, config);
  if (done) return done.value();

  wsplex::logger::set_level(static_cast<wsplex::logger::level>(loglevel));
  LOG_DEBUG("loglevel={}", loglevel);

  // A vanished peer must surface as a write error, not kill the router
  std::signal(SIGPIPE, SIG_IGN);

  try {
    auto registry = topts.tools_file
                        ? wsplex::tool_registry::load(*topts.tools_file)
                        : wsplex::tool_registry::builtin();
    wsplex::dispatcher router{config, std::move(registry)};

    LOG_INFO(
        "wsplex: transport={} socket={} pid={} connect={} read={} ttl={} "
        "tools={}",
        topts.transport, config.names.socket, config.names.pid,
        config.connect_timeout, config.read_timeout, config.cache_ttl,
        router.tools().all().size());

    if (topts.transport == "http") {
      wsplex::run_web_server(
          router, topts.address, topts.port, topts.threads * 4);
    } else {
      wsplex::run_stdio_server(router, topts.threads);
    }
    return 0;
  } catch (const wsplex::config_error& e) {
    LOG_FATAL("configuration error: {}", e.what());
    return 2;
  } catch (const std::exception& e) {
    LOG_FATAL("{}", e.what());
    return 1;
  }
}
