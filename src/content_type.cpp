#include "content_type.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <filesystem>

namespace fs = std::filesystem;

namespace rawhttp {

namespace {

const std::unordered_map<std::string, std::string> kExtensionTypes = {
    {".html", kContentTypeHtml},
    {".htm",  kContentTypeHtml},
    {".txt",  kContentTypePlain},
};

bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// UTF-8 encodings of the non-ASCII Unicode White_Space code points
const char* const kUnicodeSpaces[] = {
    "\xC2\x85",     "\xC2\xA0",     "\xE1\x9A\x80", "\xE2\x80\x80", "\xE2\x80\x81",
    "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86",
    "\xE2\x80\x87", "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", "\xE2\x80\xA8",
    "\xE2\x80\xA9", "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80",
};

// Byte length of the whitespace character at pos, 0 if there is none
size_t whitespace_length(const std::string& s, size_t pos) {
    if (is_ascii_space(s[pos])) {
        return 1;
    }
    for (const char* space : kUnicodeSpaces) {
        size_t len = std::char_traits<char>::length(space);
        if (s.compare(pos, len, space) == 0) {
            return len;
        }
    }
    return 0;
}

bool starts_with(const std::string& s, size_t pos, const char* prefix) {
    return s.compare(pos, std::char_traits<char>::length(prefix), prefix) == 0;
}

} // namespace

std::string sniff_content_type(const std::string& body) {
    size_t start = 0;
    while (start < body.size()) {
        size_t len = whitespace_length(body, start);
        if (len == 0) break;
        start += len;
    }

    if (starts_with(body, start, "<!DOCTYPE html>") || starts_with(body, start, "<html")) {
        return kContentTypeHtml;
    }
    return kContentTypePlain;
}

std::string content_type_for_path(const std::string& path, const std::string& body) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = kExtensionTypes.find(ext);
    if (it != kExtensionTypes.end()) {
        return it->second;
    }
    return sniff_content_type(body);
}

} // namespace rawhttp
