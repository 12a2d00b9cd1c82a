#include "request_parser.hpp"

namespace rawhttp {

namespace {

bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::vector<std::string> tokenize_request_line(const char* data, size_t size) {
    std::vector<std::string> tokens;
    if (data == nullptr || size == 0) {
        return tokens;
    }

    size_t line_end = 0;
    while (line_end < size && data[line_end] != '\n') {
        ++line_end;
    }

    size_t pos = 0;
    while (pos < line_end) {
        while (pos < line_end && is_ascii_space(data[pos])) {
            ++pos;
        }
        size_t start = pos;
        while (pos < line_end && !is_ascii_space(data[pos])) {
            ++pos;
        }
        if (pos > start) {
            tokens.emplace_back(data + start, pos - start);
        }
    }
    return tokens;
}

std::optional<Request> parse_request(const char* data, size_t size) {
    auto tokens = tokenize_request_line(data, size);
    if (tokens.size() < 2) {
        return std::nullopt;
    }
    return Request{tokens[0], tokens[1]};
}

} // namespace rawhttp
