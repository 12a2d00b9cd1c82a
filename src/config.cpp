#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <sys/socket.h>
#include <climits>
#include <cstdlib>
#include <stdexcept>

namespace rawhttp {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

static int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid integer in ") + name + ": " + val);
    }
}

// Present keys must convert; absent keys leave the default untouched
template <typename T>
static void read_value(const YAML::Node& section, const char* key, T& out) {
    if (auto node = section[key]) {
        out = node.as<T>();
    }
}

static long long read_ranged(const YAML::Node& section, const char* key,
                             long long current, long long min, long long max) {
    long long value = current;
    read_value(section, key, value);
    if (value < min || value > max) {
        throw std::runtime_error(std::string(key) + " = " + std::to_string(value) +
                                 " is out of range [" + std::to_string(min) + ", " +
                                 std::to_string(max) + "]");
    }
    return value;
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    try {
        if (auto s = root["server"]) {
            auto& srv = cfg.server;
            read_value(s, "host", srv.host);
            read_value(s, "doc_root", srv.doc_root);
            read_value(s, "server_name", srv.server_name);
            read_value(s, "confine_to_root", srv.confine_to_root);
            srv.port = static_cast<uint16_t>(read_ranged(s, "port", srv.port, 0, 65535));
            srv.buffer_size = static_cast<size_t>(
                read_ranged(s, "buffer_size", static_cast<long long>(srv.buffer_size), 1, 1 << 20));
            srv.read_timeout_ms = static_cast<int>(
                read_ranged(s, "read_timeout_ms", srv.read_timeout_ms, 0, INT_MAX));
            srv.write_timeout_ms = static_cast<int>(
                read_ranged(s, "write_timeout_ms", srv.write_timeout_ms, 0, INT_MAX));
            srv.backlog = static_cast<int>(read_ranged(s, "backlog", srv.backlog, 1, SOMAXCONN));
        }

        if (auto l = root["logging"]) {
            auto& log = cfg.logging;
            read_value(l, "level", log.level);
            read_value(l, "file", log.file);
            log.max_file_size_mb = static_cast<int>(
                read_ranged(l, "max_file_size_mb", log.max_file_size_mb, 1, 4096));
            log.max_files = static_cast<int>(read_ranged(l, "max_files", log.max_files, 1, 1000));
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config value in " + path + ": " + std::string(e.what()));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid config value in " + path + ": " + std::string(e.what()));
    }

    apply_env_overrides(cfg);
    return cfg;
}

void apply_env_overrides(AppConfig& cfg) {
    cfg.server.host = env_or("RAWHTTP_HOST", cfg.server.host);
    int port = env_int_or("RAWHTTP_PORT", cfg.server.port);
    if (port < 0 || port > 65535) {
        throw std::runtime_error("RAWHTTP_PORT out of range: " + std::to_string(port));
    }
    cfg.server.port = static_cast<uint16_t>(port);
    cfg.server.doc_root = env_or("RAWHTTP_DOC_ROOT", cfg.server.doc_root);
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);
}

} // namespace rawhttp
