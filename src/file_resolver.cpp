#include "file_resolver.hpp"
#include "content_type.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace rawhttp {

std::string normalize_request_path(const std::string& path) {
    return path == "/" ? "/index.html" : path;
}

std::string resolve_target(const std::string& doc_root, const std::string& path) {
    return doc_root + path;
}

bool is_within_root(const std::string& doc_root, const std::string& target) {
    std::error_code ec;
    fs::path root = fs::canonical(doc_root, ec);
    if (ec) {
        spdlog::warn("Document root {} cannot be resolved: {}", doc_root, ec.message());
        return false;
    }

    fs::path full = fs::weakly_canonical(target, ec);
    if (ec) {
        return false;
    }

    // Component-wise prefix, so "public2/x" is not inside "public"
    auto root_end = root.end();
    auto it = std::mismatch(root.begin(), root_end, full.begin(), full.end());
    return it.first == root_end;
}

bool is_valid_utf8(const std::string& data) {
    const auto* s = reinterpret_cast<const unsigned char*>(data.data());
    const size_t n = data.size();
    size_t i = 0;

    while (i < n) {
        unsigned char c = s[i];
        size_t len;
        uint32_t cp;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range code points
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

std::optional<std::string> read_file(const std::string& path) {
    // Filesystem calls see c_str(), which would silently end the path at a NUL
    if (path.find('\0') != std::string::npos) {
        spdlog::warn("Cannot serve path with embedded NUL byte");
        return std::nullopt;
    }

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        spdlog::warn("Cannot serve {}: is a directory", path);
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        spdlog::warn("Cannot open {}: {}", path, std::strerror(errno));
        return std::nullopt;
    }

    std::string contents((std::istreambuf_iterator<char>(file)),
                          std::istreambuf_iterator<char>());
    if (file.bad()) {
        spdlog::warn("Failed to read {}", path);
        return std::nullopt;
    }

    if (!is_valid_utf8(contents)) {
        spdlog::warn("Cannot serve {}: not valid UTF-8 text", path);
        return std::nullopt;
    }
    return contents;
}

Response serve_file(const ServerConfig& config, const std::string& request_path) {
    std::string target = resolve_target(config.doc_root, normalize_request_path(request_path));
    spdlog::debug("Attempting to serve file: {}", target);

    if (target.find('\0') != std::string::npos) {
        spdlog::warn("Rejecting request path with embedded NUL byte");
        return not_found();
    }

    if (config.confine_to_root && !is_within_root(config.doc_root, target)) {
        spdlog::warn("Path traversal attempt: {} -> {}", request_path, target);
        return not_found();
    }

    auto contents = read_file(target);
    if (!contents) {
        return not_found();
    }

    Response response;
    response.status = 200;
    response.reason = "OK";
    response.content_type = content_type_for_path(target, *contents);
    response.body = std::move(*contents);
    return response;
}

} // namespace rawhttp
