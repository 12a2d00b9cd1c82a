#pragma once

#include "config.hpp"
#include "http_response.hpp"
#include <cstddef>

namespace rawhttp {

// Route the bytes of one request: 400 for a malformed request line,
// 405 for any method other than GET, otherwise the file lookup result.
Response build_response(const ServerConfig& config, const char* data, size_t size);

// Serve one accepted connection: apply deadlines, read once, respond once.
// A failed read drops the connection without a response. Does not close fd.
void handle_connection(int fd, const ServerConfig& config);

} // namespace rawhttp
