#include "http_response.hpp"
#include "content_type.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace rawhttp {

namespace {
constexpr const char* kHttpVersion = "HTTP/1.1";
}

Response bad_request() {
    return Response{400, "Bad Request", "Invalid request format", ""};
}

Response not_found() {
    return Response{404, "Not Found", "The requested file was not found", ""};
}

Response method_not_allowed() {
    return Response{405, "Method Not Allowed", "Only GET method is supported", ""};
}

std::string format_response(const Response& response, const std::string& server_name) {
    const std::string content_type = response.content_type.empty()
        ? sniff_content_type(response.body)
        : response.content_type;

    std::ostringstream oss;
    oss << kHttpVersion << " " << response.status << " " << response.reason << "\r\n"
        << "Server: " << server_name << "\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Content-Type: " << content_type << "\r\n"
        << "Connection: close\r\n"
        << "\r\n"
        << response.body;
    return oss.str();
}

bool send_response(int fd, const Response& response, const std::string& server_name) {
    std::string wire = format_response(response, server_name);

    ssize_t sent = send(fd, wire.data(), wire.size(), MSG_NOSIGNAL);
    if (sent < 0) {
        spdlog::error("Failed to send response: {}", std::strerror(errno));
        return false;
    }
    if (static_cast<size_t>(sent) != wire.size()) {
        spdlog::warn("Partial response write: {} of {} bytes", sent, wire.size());
        return false;
    }

    spdlog::debug("Response sent successfully ({} {}, {} bytes)",
                  response.status, response.reason, sent);
    return true;
}

} // namespace rawhttp
