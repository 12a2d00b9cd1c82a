#pragma once

#include <string>

namespace rawhttp {

constexpr const char* kContentTypeHtml = "text/html; charset=utf-8";
constexpr const char* kContentTypePlain = "text/plain; charset=utf-8";

// Guess HTML vs plain text from the body's leading bytes.
// Leading ASCII and Unicode (UTF-8 encoded) whitespace is skipped; the
// "<!DOCTYPE html>" / "<html" match is case-sensitive.
std::string sniff_content_type(const std::string& body);

// Extension lookup (.html/.htm/.txt), falling back to sniff_content_type(body)
// for anything else. The extension takes precedence over the body, so a
// ".html" file is served as HTML even if it does not start with markup, and a
// ".txt" file as plain text even if it does. Only extensionless or unknown
// files and the fixed error bodies are classified purely by sniffing.
std::string content_type_for_path(const std::string& path, const std::string& body);

} // namespace rawhttp
