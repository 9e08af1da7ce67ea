// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file jsonrpc.hpp
 * @brief JSONRPC 2.0 envelopes and newline framing over async byte streams.
 *
 * Every message is one UTF-8 JSON object terminated by a single @c '\n'.
 * The readers keep unconsumed bytes in a caller-owned buffer, so the same
 * buffer must be passed to every read on a given stream.  They are meant
 * to be used with @c co_await in a coroutine context.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/json.hpp>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wsplex::jsonrpc {

namespace json = boost::json;

constexpr int PARSE_ERROR{-32700};
constexpr int INVALID_REQUEST{-32600};
constexpr int METHOD_NOT_FOUND{-32601};
constexpr int INVALID_PARAMS{-32602};
constexpr int INTERNAL_ERROR{-32603};

// Default upper bound for one framed message.
constexpr std::size_t max_line_length{64UL * 1024 * 1024};

// Thrown by the readers for a line over their limit.  The whole line, up to
// and including its terminator, has been consumed, so reading may go on.
struct line_too_long : std::runtime_error {
  using std::runtime_error::runtime_error;
};

json::object make_result(const json::value& id, json::value result);

json::object make_error(
    const json::value& id, int code, std::string_view message);

// Serialized @p msg followed by the line terminator.
std::string frame_line(const json::object& msg);

/** @brief Read one line from @p stream.
 *
 * Returns the line without its terminator (a trailing @c '\r' is dropped
 * too).  At EOF a final unterminated line is returned once; after that, an
 * empty optional.  A line longer than @p max_line throws @c line_too_long.
 */
boost::asio::awaitable<std::optional<std::string>> read_line(
    boost::asio::posix::stream_descriptor& stream, std::string& buffer,
    std::size_t max_line = max_line_length);

boost::asio::awaitable<std::optional<std::string>> read_line(
    boost::asio::local::stream_protocol::socket& stream, std::string& buffer,
    std::size_t max_line = max_line_length);

// Write @p msg as a single line with one async operation.
boost::asio::awaitable<void> write_line(
    boost::asio::local::stream_protocol::socket& stream,
    const json::object& msg);

}  // namespace wsplex::jsonrpc
