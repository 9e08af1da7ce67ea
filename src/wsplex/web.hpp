#pragma once

#include <boost/beast/http.hpp>
#include <string>

namespace wsplex {

class dispatcher;

namespace http = boost::beast::http;

// Answer one HTTP request.  POST bodies are single JSONRPC requests; every
// response body, errors included, is JSON.
http::response<http::string_body> handle_http_request(
    const http::request<http::string_body>& req, dispatcher& router);

// Start the HTTP server. Blocks until the process receives SIGINT/SIGTERM
// and the connections in flight have been served.
void run_web_server(
    dispatcher& router, const std::string& address, int port,
    int max_connections);

}  // namespace wsplex
