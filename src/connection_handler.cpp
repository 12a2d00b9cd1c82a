#include "connection_handler.hpp"
#include "file_resolver.hpp"
#include "request_parser.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace rawhttp {

static void set_socket_timeout(int fd, int optname, int timeout_ms) {
    if (timeout_ms <= 0) return;

    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (setsockopt(fd, SOL_SOCKET, optname, &tv, sizeof(tv)) < 0) {
        spdlog::warn("Failed to set socket timeout: {}", std::strerror(errno));
    }
}

Response build_response(const ServerConfig& config, const char* data, size_t size) {
    auto request = parse_request(data, size);
    if (!request) {
        spdlog::info("Malformed request line");
        return bad_request();
    }

    spdlog::info("Method: {}, Path: {}", request->method, request->path);

    if (request->method != "GET") {
        return method_not_allowed();
    }
    return serve_file(config, request->path);
}

void handle_connection(int fd, const ServerConfig& config) {
    set_socket_timeout(fd, SO_RCVTIMEO, config.read_timeout_ms);
    set_socket_timeout(fd, SO_SNDTIMEO, config.write_timeout_ms);

    // Single read; anything beyond buffer_size is ignored
    std::vector<char> buffer(config.buffer_size);
    ssize_t n = recv(fd, buffer.data(), buffer.size(), 0);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            spdlog::warn("Read deadline of {} ms expired, dropping connection", config.read_timeout_ms);
        } else {
            spdlog::error("Failed to read from connection: {}", std::strerror(errno));
        }
        return;
    }

    spdlog::debug("Received {} bytes", n);

    Response response = build_response(config, buffer.data(), static_cast<size_t>(n));
    if (!send_response(fd, response, config.server_name)) {
        spdlog::debug("Dropping connection after failed write");
    }
}

} // namespace rawhttp
