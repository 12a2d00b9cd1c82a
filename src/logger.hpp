#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rawhttp {

// Console sink that sends progress (< warn) to stdout and diagnostics (>= warn) to stderr
class SplitConsoleSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    SplitConsoleSink();

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override;
    void set_pattern_(const std::string& pattern) override;
    void set_formatter_(std::unique_ptr<spdlog::formatter> formatter) override;

private:
    spdlog::sink_ptr out_;
    spdlog::sink_ptr err_;
};

// nullopt for names spdlog does not know
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& level);

// Build the "rawhttp" logger from config. Throws std::runtime_error for an
// unknown level or a log file that cannot be opened.
std::shared_ptr<spdlog::logger> make_logger(const LoggingConfig& cfg);

// make_logger() + install as spdlog's default logger
void init_logger(const LoggingConfig& cfg);

} // namespace rawhttp
