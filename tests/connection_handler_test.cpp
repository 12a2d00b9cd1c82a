#include "connection_handler.hpp"
#include "content_type.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <sys/socket.h>
#include <unistd.h>

#include <string>

using namespace rawhttp;

namespace {

class ConnectionHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_.write("index.html", "<!DOCTYPE html><html><body>Hi</body></html>");
        root_.write("notes.txt", "hello world");
        config_.doc_root = root_.str();
    }

    Response route(const std::string& raw) {
        return build_response(config_, raw.data(), raw.size());
    }

    // Run handle_connection over a socketpair and collect whatever it writes back
    std::string roundtrip(const std::string& raw) {
        int fds[2];
        EXPECT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        if (!raw.empty()) {
            EXPECT_EQ(write(fds[1], raw.data(), raw.size()), static_cast<ssize_t>(raw.size()));
        } else {
            shutdown(fds[1], SHUT_WR);
        }

        handle_connection(fds[0], config_);
        close(fds[0]);

        std::string out;
        char buf[1024];
        ssize_t n;
        while ((n = read(fds[1], buf, sizeof(buf))) > 0) {
            out.append(buf, static_cast<size_t>(n));
        }
        close(fds[1]);
        return out;
    }

    test::TempDir root_;
    ServerConfig config_;
};

} // namespace

TEST_F(ConnectionHandlerTest, GetExistingFileIs200) {
    auto response = route("GET /notes.txt HTTP/1.1\r\nHost: x\r\n\r\n");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "hello world");
}

TEST_F(ConnectionHandlerTest, GetMissingFileIs404) {
    auto response = route("GET /missing.html HTTP/1.1\r\n\r\n");
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(response.body, "The requested file was not found");
}

TEST_F(ConnectionHandlerTest, OtherMethodsAre405RegardlessOfPath) {
    for (const char* method : {"POST", "DELETE", "PUT", "HEAD", "get"}) {
        for (const char* path : {"/", "/notes.txt", "/missing"}) {
            auto response = route(std::string(method) + " " + path + " HTTP/1.1\r\n\r\n");
            EXPECT_EQ(response.status, 405) << method << " " << path;
            EXPECT_EQ(response.body, "Only GET method is supported");
        }
    }
}

TEST_F(ConnectionHandlerTest, MalformedRequestLineIs400) {
    for (const char* raw : {"", "\r\n", "GET\r\n", "   \r\nGET / HTTP/1.1\r\n"}) {
        auto response = route(raw);
        EXPECT_EQ(response.status, 400) << "request: '" << raw << "'";
        EXPECT_EQ(response.reason, "Bad Request");
        EXPECT_EQ(response.body, "Invalid request format");
    }
}

TEST_F(ConnectionHandlerTest, NulByteInPathIs404) {
    const std::string raw("GET /notes.txt\0.html HTTP/1.1\r\n\r\n", 33);
    auto response = route(raw);
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(response.body, "The requested file was not found");
}

TEST_F(ConnectionHandlerTest, RequestLineWithoutVersionIsAccepted) {
    EXPECT_EQ(route("GET /notes.txt").status, 200);
}

TEST_F(ConnectionHandlerTest, WritesFormattedResponse) {
    auto parsed = test::parse_response(roundtrip("GET / HTTP/1.1\r\n\r\n"));
    EXPECT_EQ(parsed.status_line, "HTTP/1.1 200 OK");
    EXPECT_EQ(parsed.headers["Server"], "RustRawHTTP/1.0");
    EXPECT_EQ(parsed.headers["Content-Type"], kContentTypeHtml);
    EXPECT_EQ(parsed.headers["Connection"], "close");
    EXPECT_EQ(parsed.body, "<!DOCTYPE html><html><body>Hi</body></html>");
    EXPECT_EQ(parsed.headers["Content-Length"], std::to_string(parsed.body.size()));
}

TEST_F(ConnectionHandlerTest, ZeroByteReadIs400) {
    auto parsed = test::parse_response(roundtrip(""));
    EXPECT_EQ(parsed.status, 400);
    EXPECT_EQ(parsed.body, "Invalid request format");
}

TEST_F(ConnectionHandlerTest, RequestBeyondBufferIsTruncated) {
    config_.buffer_size = 8;
    // Only "GET /not" fits in the buffer
    auto parsed = test::parse_response(roundtrip("GET /notes.txt HTTP/1.1\r\n\r\n"));
    EXPECT_EQ(parsed.status, 404);
}

TEST_F(ConnectionHandlerTest, ReadTimeoutSendsNothing) {
    config_.read_timeout_ms = 100;

    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    handle_connection(fds[0], config_);
    close(fds[0]);

    char buf[64];
    EXPECT_EQ(read(fds[1], buf, sizeof(buf)), 0);
    close(fds[1]);
}
