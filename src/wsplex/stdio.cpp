#include "stdio.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/write.hpp>
#include <boost/json.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <atomic>
#include <cerrno>
#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../libwsplex/auto.hpp"
#include "../libwsplex/logger.hpp"
#include "wsplex/dispatcher.hpp"
#include "wsplex/jsonrpc.hpp"

namespace asio = boost::asio;
namespace json = boost::json;
namespace sys = boost::system;

namespace wsplex {

namespace {

/// Output side

// Whole-line writes under one lock: concurrent tasks never interleave
// inside a line.
class line_writer {
 public:
  explicit line_writer(asio::posix::stream_descriptor& out) : out{&out} {}

  void send(const json::object& msg) {
    auto text = jsonrpc::frame_line(msg);
    std::lock_guard lock{mutex};
    sys::error_code ec{};
    asio::write(*out, asio::buffer(text), ec);
    if (ec) LOG_WARN("write to output failed: {}", ec.message());
  }

 private:
  asio::posix::stream_descriptor* out;
  std::mutex mutex;
};

int dup_or_throw(int fd) {
  int copy = ::dup(fd);
  if (copy < 0)
    throw sys::system_error{
      sys::error_code{errno, sys::system_category()}, "dup"};
  return copy;
}

/// Tasks

asio::awaitable<void> dispatch_line(
    dispatcher& router, line_writer& out, std::string text,
    std::atomic<int>& outstanding) {
  AUTO(--outstanding);

  std::optional<json::object> response{};
  try {
    response = co_await router.handle_frame(std::move(text));
  } catch (const std::exception& e) {
    LOG_ERROR("dispatch failed: {}", e.what());
    response = jsonrpc::make_error(
        nullptr, jsonrpc::INTERNAL_ERROR,
        std::string{"Internal error: "} + e.what());
  }
  if (response) out.send(*response);
}

asio::awaitable<void> read_loop(
    dispatcher& router, asio::posix::stream_descriptor& in, line_writer& out,
    std::atomic<int>& outstanding, std::size_t max_line) {
  auto executor = co_await asio::this_coro::executor;
  std::string buffer{};

  for (;;) {
    std::optional<std::string> line{};
    try {
      line = co_await jsonrpc::read_line(in, buffer, max_line);
    } catch (const jsonrpc::line_too_long& e) {
      LOG_WARN("dropping input line: {}", e.what());
      out.send(jsonrpc::make_error(
          nullptr, jsonrpc::INVALID_REQUEST,
          std::string{"Invalid Request: "} + e.what()));
      continue;
    } catch (const sys::system_error& e) {
      LOG_ERROR("input read failed: {}", e.what());
      break;
    }
    if (!line) break;  // EOF
    if (line->find_first_not_of(" \t") == std::string::npos) continue;

    ++outstanding;
    asio::co_spawn(
        executor, dispatch_line(router, out, std::move(*line), outstanding),
        asio::detached);
  }

  LOG_INFO(
      "input closed, draining {} outstanding request(s)", outstanding.load());
}

}  // namespace

/// Server loop

void run_stdio_server(
    dispatcher& router, int threads, int in_fd, int out_fd,
    std::size_t max_line) {
  if (threads < 1) threads = 1;

  asio::io_context ctx{threads};

  // Duplicate the descriptors so closing ours leaves the caller's intact
  asio::posix::stream_descriptor in{ctx, dup_or_throw(in_fd)};
  asio::posix::stream_descriptor out{ctx, dup_or_throw(out_fd)};

  line_writer writer{out};
  std::atomic<int> outstanding{0};

  asio::co_spawn(
      ctx, read_loop(router, in, writer, outstanding, max_line),
      asio::detached);

  // run() returns only once the read loop and every dispatch have finished
  std::vector<std::thread> pool;
  pool.reserve(threads - 1);
  for (int i = 1; i < threads; ++i) pool.emplace_back([&ctx] { ctx.run(); });
  ctx.run();
  for (auto& t : pool) t.join();

  LOG_INFO("stdio session ended");
}

}  // namespace wsplex
