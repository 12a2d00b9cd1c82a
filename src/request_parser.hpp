#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rawhttp {

struct Request {
    std::string method;
    std::string path;
};

// Split the first line of a raw request buffer on ASCII whitespace.
// The line ends at the first '\n' (a trailing '\r' is dropped) or at the end
// of the buffer. Bytes outside ASCII are kept as-is; empty tokens are discarded.
std::vector<std::string> tokenize_request_line(const char* data, size_t size);

// Method and path from the request line, or nullopt when it has fewer than two tokens.
// No validation of method names, path syntax or version token is performed.
std::optional<Request> parse_request(const char* data, size_t size);

} // namespace rawhttp
