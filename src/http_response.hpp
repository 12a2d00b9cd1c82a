#pragma once

#include <string>

namespace rawhttp {

struct Response {
    int status = 200;
    std::string reason = "OK";
    std::string body;
    std::string content_type;  // empty = sniff from body
};

// Fixed responses for requests that never reach the filesystem
Response bad_request();
Response not_found();
Response method_not_allowed();

// Serialize status line, Server / Content-Length / Content-Type / Connection headers and body
std::string format_response(const Response& response, const std::string& server_name);

// Write the formatted response in a single send(); failures are logged, not retried.
// Returns true if every byte was written.
bool send_response(int fd, const Response& response, const std::string& server_name);

} // namespace rawhttp
