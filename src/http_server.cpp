#include "http_server.hpp"
#include "connection_handler.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>

namespace rawhttp {

std::chrono::milliseconds accept_retry_delay(int err) {
    switch (err) {
    case EMFILE:
    case ENFILE:
    case ENOBUFS:
    case ENOMEM:
        return std::chrono::milliseconds(100);
    default:
        return std::chrono::milliseconds(0);
    }
}

HttpServer::HttpServer(const ServerConfig& config)
    : config_(std::make_shared<const ServerConfig>(config))
    , bound_port_(config.port)
{
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_->port);
    if (inet_pton(AF_INET, config_->host.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("HTTP: Invalid listen address {}", config_->host);
        return false;
    }

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        spdlog::error("HTTP: Failed to create socket: {}", std::strerror(errno));
        return false;
    }

    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        spdlog::warn("HTTP: Failed to set SO_REUSEADDR: {}", std::strerror(errno));
    }

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("HTTP: Failed to bind to address {}:{}: {}",
                      config_->host, config_->port, std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, config_->backlog) < 0) {
        spdlog::error("HTTP: Failed to listen: {}", std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    }

    running_.store(true);
    thread_ = std::thread(&HttpServer::server_thread, this, server_fd_);
    spdlog::info("HTTP server listening on http://{}:{} (root: {})",
                 config_->host, bound_port_, config_->doc_root);
    return true;
}

void HttpServer::stop() {
    running_.store(false);
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }
}

void HttpServer::wait() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void HttpServer::server_thread(int listen_fd) {
    spdlog::info("Waiting for connections...");

    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            int err = errno;
            if (running_.load()) {
                spdlog::warn("HTTP: Connection failed: {}", std::strerror(err));
                auto delay = accept_retry_delay(err);
                if (delay.count() > 0) {
                    std::this_thread::sleep_for(delay);
                }
            }
            continue;
        }

        char peer[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &client_addr.sin_addr, peer, sizeof(peer));
        spdlog::info("New connection: {}:{}", peer, ntohs(client_addr.sin_port));

        // Connection threads own a reference to the config, never to the server
        std::shared_ptr<const ServerConfig> config = config_;
        try {
            std::thread([config, client_fd]() {
                handle_connection(client_fd, *config);
                close(client_fd);
            }).detach();
        } catch (const std::system_error& e) {
            spdlog::error("HTTP: Failed to spawn connection thread: {}", e.what());
            close(client_fd);
        }
    }
}

} // namespace rawhttp
