#include "config.hpp"
#include "logger.hpp"
#include "http_server.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <iostream>

static void print_banner(const rawhttp::AppConfig& cfg) {
    spdlog::info("rawhttp v" APP_VERSION);
    spdlog::info("Configuration:");
    spdlog::info("  Listen address  : {}:{}", cfg.server.host, cfg.server.port);
    spdlog::info("  Document root   : {}", cfg.server.doc_root);
    spdlog::info("  Read buffer     : {} bytes", cfg.server.buffer_size);
    spdlog::info("  Read deadline   : {}", cfg.server.read_timeout_ms > 0
                 ? std::to_string(cfg.server.read_timeout_ms) + " ms" : "(none)");
    spdlog::info("  Write deadline  : {}", cfg.server.write_timeout_ms > 0
                 ? std::to_string(cfg.server.write_timeout_ms) + " ms" : "(none)");
    spdlog::info("  Confine to root : {}", cfg.server.confine_to_root ? "yes" : "no");
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: rawhttp [options]\n"
                      << "Options:\n"
                      << "  -c, --config <path>    Config file (default: config.yaml if present)\n"
                      << "  -h, --help             Show this help\n"
                      << "\nEnvironment variables:\n"
                      << "  RAWHTTP_HOST           Listen address\n"
                      << "  RAWHTTP_PORT           Listen port\n"
                      << "  RAWHTTP_DOC_ROOT       Document root directory\n"
                      << "  LOG_LEVEL              Log level (trace/debug/info/warn/error/critical/off)\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << " (see --help)" << std::endl;
            return 1;
        }
    }

    // ─── Load configuration and initialize logger ─────────────────────────────
    rawhttp::AppConfig config;
    try {
        if (!config_path.empty()) {
            config = rawhttp::load_config(config_path);
        } else if (std::filesystem::exists("config.yaml")) {
            config = rawhttp::load_config("config.yaml");
        } else {
            rawhttp::apply_env_overrides(config);
        }
        rawhttp::init_logger(config.logging);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    print_banner(config);

    // ─── Start listener ───────────────────────────────────────────────────────
    rawhttp::HttpServer http_server(config.server);
    if (!http_server.start()) {
        spdlog::critical("Failed to bind to address {}:{}", config.server.host, config.server.port);
        return 1;
    }

    // Runs until the process is killed
    http_server.wait();
    return 0;
}
