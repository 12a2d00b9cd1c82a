#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rawhttp {

namespace {
constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] [%t] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] %v";
}

SplitConsoleSink::SplitConsoleSink()
    : out_(std::make_shared<spdlog::sinks::stdout_color_sink_st>())
    , err_(std::make_shared<spdlog::sinks::stderr_color_sink_st>())
{
}

void SplitConsoleSink::sink_it_(const spdlog::details::log_msg& msg) {
    if (msg.level >= spdlog::level::warn) {
        err_->log(msg);
    } else {
        out_->log(msg);
    }
}

void SplitConsoleSink::flush_() {
    out_->flush();
    err_->flush();
}

void SplitConsoleSink::set_pattern_(const std::string& pattern) {
    out_->set_pattern(pattern);
    err_->set_pattern(pattern);
}

void SplitConsoleSink::set_formatter_(std::unique_ptr<spdlog::formatter> formatter) {
    out_->set_formatter(formatter->clone());
    err_->set_formatter(std::move(formatter));
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> make_logger(const LoggingConfig& cfg) {
    auto level = parse_log_level(cfg.level);
    if (!level) {
        throw std::runtime_error("Unknown log level: " + cfg.level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<SplitConsoleSink>();
    console->set_pattern(kConsolePattern);
    sinks.push_back(console);

    if (!cfg.file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.file,
                static_cast<size_t>(cfg.max_file_size_mb) * 1024 * 1024,
                static_cast<size_t>(cfg.max_files));
            file_sink->set_pattern(kFilePattern);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            throw std::runtime_error("Cannot open log file " + cfg.file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("rawhttp", sinks.begin(), sinks.end());
    logger->set_level(*level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

void init_logger(const LoggingConfig& cfg) {
    spdlog::set_default_logger(make_logger(cfg));
}

} // namespace rawhttp
