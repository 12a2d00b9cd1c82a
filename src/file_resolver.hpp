#pragma once

#include "config.hpp"
#include "http_response.hpp"
#include <optional>
#include <string>

namespace rawhttp {

// "/" -> "/index.html", everything else unchanged
std::string normalize_request_path(const std::string& path);

// Plain concatenation of document root and request path ("public" + "/a.txt").
// No ".." normalization and no existence check.
std::string resolve_target(const std::string& doc_root, const std::string& path);

// True if target, once canonicalized, lies inside the canonical doc_root
bool is_within_root(const std::string& doc_root, const std::string& target);

// True if the bytes form well-formed UTF-8
bool is_valid_utf8(const std::string& data);

// Read a whole file as UTF-8 text. Missing, unreadable, directory and
// non-UTF-8 files, and paths containing a NUL byte, all yield nullopt;
// the cause is logged.
std::optional<std::string> read_file(const std::string& path);

// 200 with the file contents, or the fixed 404
Response serve_file(const ServerConfig& config, const std::string& request_path);

} // namespace rawhttp
