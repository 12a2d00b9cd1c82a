#include "test_helpers.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace rawhttp::test {

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    path_ = fs::temp_directory_path() /
        ("rawhttp-test-" + std::to_string(getpid()) + "-" + std::to_string(counter++));
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void TempDir::write(const std::string& relative, const std::string& contents) const {
    fs::path target = path_ / relative;
    fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary);
    out << contents;
}

ParsedResponse parse_response(const std::string& raw) {
    ParsedResponse parsed;

    auto head_end = raw.find("\r\n\r\n");
    if (head_end == std::string::npos) {
        return parsed;
    }
    parsed.body = raw.substr(head_end + 4);

    std::string head = raw.substr(0, head_end);
    size_t pos = head.find("\r\n");
    parsed.status_line = head.substr(0, pos);

    auto first_space = parsed.status_line.find(' ');
    if (first_space != std::string::npos) {
        parsed.status = std::stoi(parsed.status_line.substr(first_space + 1, 3));
    }

    while (pos != std::string::npos) {
        size_t start = pos + 2;
        size_t end = head.find("\r\n", start);
        std::string line = head.substr(start, end == std::string::npos ? std::string::npos : end - start);
        auto colon = line.find(": ");
        if (colon != std::string::npos) {
            parsed.headers[line.substr(0, colon)] = line.substr(colon + 2);
        }
        pos = end;
    }
    return parsed;
}

int connect_to(uint16_t port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("socket: ") + std::strerror(errno));
    }

    timeval tv{};
    tv.tv_sec = 5;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        throw std::runtime_error(std::string("connect: ") + std::strerror(err));
    }
    return fd;
}

std::string exchange(uint16_t port, const std::string& request) {
    int fd = connect_to(port);

    if (!request.empty()) {
        send(fd, request.data(), request.size(), MSG_NOSIGNAL);
    } else {
        // Zero-byte request: half-close so the server's read returns 0
        shutdown(fd, SHUT_WR);
    }

    std::string response;
    char buf[4096];
    ssize_t n;
    while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) {
        response.append(buf, static_cast<size_t>(n));
    }
    close(fd);
    return response;
}

} // namespace rawhttp::test
