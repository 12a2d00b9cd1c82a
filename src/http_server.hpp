#pragma once

#include "config.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace rawhttp {

// Pause before the next accept() after errno err. Non-zero only for descriptor
// or memory exhaustion, which would otherwise fail again immediately.
std::chrono::milliseconds accept_retry_delay(int err);

// Static file server: one accept thread, one detached thread per connection
class HttpServer {
public:
    explicit HttpServer(const ServerConfig& config);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind + listen and spawn the accept loop. False if the socket could not be bound.
    bool start();
    void stop();

    // Block until the accept loop exits
    void wait();

    bool is_running() const { return running_.load(); }

    // Actual bound port (differs from config when port 0 was requested)
    uint16_t port() const { return bound_port_; }

private:
    void server_thread(int listen_fd);

    std::shared_ptr<const ServerConfig> config_;
    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace rawhttp
