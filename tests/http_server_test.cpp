#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "http_server.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

namespace {
// Holds every request for a while before answering.
class SlowHandler : public IHttpRequestHandler {
public:
    void handleRequest(const HttpRequest& req, HttpResponse& resp) override {
        entered.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        resp.body = "served " + req.path;
        finished.store(true);
    }

    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
};

std::string fetch(int port, const std::string& request)
{
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return "";
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    std::string reply;
    if (::connect(fd, (sockaddr*)&addr, sizeof(addr)) == 0 &&
        ::send(fd, request.data(), request.size(), MSG_NOSIGNAL) == (ssize_t)request.size()) {
        char buf[512];
        ssize_t n;
        while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) reply.append(buf, buf + n);
    }
    ::close(fd);
    return reply;
}
}  // namespace

TEST_CASE("stop waits for a request that is being served")
{
    SlowHandler handler;
    HttpServer server("127.0.0.1", 0, &handler);
    REQUIRE(server.start());
    REQUIRE(server.port() > 0);

    std::string reply;
    std::thread client([&reply, &server] { reply = fetch(server.port(), "GET /slow HTTP/1.1\r\nHost: x\r\n\r\n"); });

    auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (!handler.entered.load() && std::chrono::steady_clock::now() < give_up) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    REQUIRE(handler.entered.load());

    server.stop();
    CHECK(handler.finished.load());

    client.join();
    CHECK(reply.compare(0, 15, "HTTP/1.1 200 OK") == 0);
    CHECK(reply.find("Connection: close") != std::string::npos);
    CHECK(reply.find("\r\n\r\nserved /slow") != std::string::npos);
}

TEST_CASE("a malformed request line is answered with 400")
{
    SlowHandler handler;
    HttpServer server("127.0.0.1", 0, &handler);
    REQUIRE(server.start());

    std::string reply = fetch(server.port(), "NONSENSE\r\n\r\n");
    CHECK(reply.compare(0, 24, "HTTP/1.1 400 Bad Request") == 0);
    CHECK_FALSE(handler.entered.load());
    server.stop();
}
