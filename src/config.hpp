#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace rawhttp {

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    std::string doc_root = "public";
    std::string server_name = "RustRawHTTP/1.0";
    size_t buffer_size = 1024;     // single read per connection
    int read_timeout_ms = 30000;   // 0 = no deadline
    int write_timeout_ms = 30000;  // 0 = no deadline
    bool confine_to_root = true;   // reject targets resolving outside doc_root
    int backlog = 128;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
};

// Load configuration from YAML file, with environment variable overrides
AppConfig load_config(const std::string& path);

// Apply RAWHTTP_* / LOG_LEVEL environment overrides on top of cfg
void apply_env_overrides(AppConfig& cfg);

} // namespace rawhttp
