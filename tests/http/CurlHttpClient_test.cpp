#include <gtest/gtest.h>
#include "http/CurlHttpClient.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>

using namespace dify_bridge;

namespace {

/**
 * @brief Listening socket that accepts connections into its backlog but never answers
 */
class SilentServer {
public:
    SilentServer() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (fd_ >= 0 &&
            ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
            ::listen(fd_, 4) == 0) {
            socklen_t len = sizeof(addr);
            if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
                port_ = ntohs(addr.sin_port);
            }
        }
    }

    ~SilentServer() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    int port() const { return port_; }

private:
    int fd_ = -1;
    int port_ = 0;
};

/**
 * @brief Find a loopback port with nothing listening on it
 */
int closed_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    int port = 0;
    if (fd >= 0 && ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        socklen_t len = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            port = ntohs(addr.sin_port);
        }
    }
    if (fd >= 0) {
        ::close(fd);
    }
    return port;
}

} // namespace

TEST(CurlHttpClientTest, TimeoutIsReportedNotThrown) {
    SilentServer server;
    ASSERT_GT(server.port(), 0);

    CurlHttpClient client;
    HttpRequest request;
    request.url = "http://127.0.0.1:" + std::to_string(server.port()) + "/mcp";
    request.headers = {{"Content-Type", "application/json"}};
    request.body = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
    request.timeout_ms = 300;

    auto start = std::chrono::steady_clock::now();
    HttpResponse response = client.post(request);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(response.transport_ok);
    EXPECT_TRUE(response.timed_out);
    EXPECT_FALSE(response.error.empty());
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 5000);
}

TEST(CurlHttpClientTest, ConnectionRefusedIsReportedNotThrown) {
    int port = closed_port();
    ASSERT_GT(port, 0);

    CurlHttpClient client;
    HttpRequest request;
    request.url = "http://127.0.0.1:" + std::to_string(port) + "/mcp";
    request.body = "{}";
    request.timeout_ms = 2000;

    HttpResponse response = client.post(request);

    EXPECT_FALSE(response.transport_ok);
    EXPECT_FALSE(response.timed_out);
    EXPECT_FALSE(response.error.empty());
    EXPECT_FALSE(response.is_success());
}
