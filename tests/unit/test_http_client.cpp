#include <catch2/catch.hpp>

#include "net/http_client.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace infergate;

namespace {

// Accepts one connection on 127.0.0.1, reads the request head and writes
// `reply` verbatim.
class OneShotServer {
public:
  explicit OneShotServer(std::string reply) : reply_(std::move(reply)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    ::listen(fd_, 1);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this] { Serve(); });
  }
  ~OneShotServer() {
    thread_.join();
    ::close(fd_);
  }

  int port() const { return port_; }
  const std::string &request() const { return request_; }

private:
  void Serve() {
    int client = ::accept(fd_, nullptr, nullptr);
    if (client < 0) {
      return;
    }
    char buffer[4096];
    while (request_.find("\r\n\r\n") == std::string::npos) {
      ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        break;
      }
      request_.append(buffer, static_cast<std::size_t>(n));
    }
    ::send(client, reply_.data(), reply_.size(), MSG_NOSIGNAL);
    // Drain any request body so the close does not reset the connection.
    ::shutdown(client, SHUT_WR);
    while (::recv(client, buffer, sizeof(buffer), 0) > 0) {
    }
    ::close(client);
  }

  std::string reply_;
  std::string request_;
  int fd_{-1};
  int port_{0};
  std::thread thread_;
};

} // namespace

// ---------------------------------------------------------------------------
// [http] URL parsing
// ---------------------------------------------------------------------------

TEST_CASE("ParseUrl splits scheme, host, port and target", "[http]") {
  auto local = ParseUrl("http://127.0.0.1:8081/v1/chat/completions");
  REQUIRE_FALSE(local.tls);
  REQUIRE(local.host == "127.0.0.1");
  REQUIRE(local.port == 8081);
  REQUIRE(local.target == "/v1/chat/completions");

  auto github = ParseUrl(
      "https://api.github.com/repos/ggml-org/llama.cpp/releases/latest");
  REQUIRE(github.tls);
  REQUIRE(github.port == 443);
  REQUIRE(github.target == "/repos/ggml-org/llama.cpp/releases/latest");

  auto bare = ParseUrl("localhost?x=1");
  REQUIRE(bare.port == 80);
  REQUIRE(bare.host == "localhost");
  REQUIRE(bare.target == "/?x=1");
}

TEST_CASE("ParseUrl rejects malformed URLs", "[http]") {
  REQUIRE_THROWS_AS(ParseUrl("ftp://host/file"), std::runtime_error);
  REQUIRE_THROWS_AS(ParseUrl("http://:8080/"), std::runtime_error);
  REQUIRE_THROWS_AS(ParseUrl("http://host:http/"), std::runtime_error);
  REQUIRE_THROWS_AS(ParseUrl("http://host:70000/"), std::runtime_error);
}

// ---------------------------------------------------------------------------
// [http] requests
// ---------------------------------------------------------------------------

TEST_CASE("HttpClient decodes a chunked reply", "[http]") {
  OneShotServer server("HTTP/1.1 200 OK\r\n"
                       "Transfer-Encoding: chunked\r\n"
                       "X-Backend: Vulkan\r\n\r\n"
                       "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
  HttpClient client;
  auto response = client.Post(
      "http://127.0.0.1:" + std::to_string(server.port()) + "/tokenize",
      R"({"content":"hi"})", {{"Authorization", "Bearer k"}});
  REQUIRE(response.Ok());
  REQUIRE(response.body == "hello world");
  REQUIRE(response.headers.at("x-backend") == "Vulkan");

  const auto &request = server.request();
  REQUIRE(request.rfind("POST /tokenize HTTP/1.1\r\n", 0) == 0);
  REQUIRE(request.find("Content-Type: application/json\r\n") !=
          std::string::npos);
  REQUIRE(request.find("Authorization: Bearer k\r\n") != std::string::npos);
}

TEST_CASE("HttpClient stops reading at Content-Length", "[http]") {
  OneShotServer server("HTTP/1.1 404 Not Found\r\n"
                       "Content-Length: 4\r\n\r\n"
                       "gonetrailing");
  HttpClient client;
  auto response =
      client.Get("http://127.0.0.1:" + std::to_string(server.port()) + "/info");
  REQUIRE(response.status == 404);
  REQUIRE_FALSE(response.Ok());
  REQUIRE(response.body == "gone");
}

TEST_CASE("HttpClient reports refused connections", "[http]") {
  int port = 0;
  {
    // Grab a free port and release it again.
    OneShotServer probe("HTTP/1.1 204 No Content\r\n\r\n");
    port = probe.port();
    HttpClient().Get("http://127.0.0.1:" + std::to_string(port) + "/");
  }
  HttpClient client;
  REQUIRE_THROWS_AS(client.Get("http://127.0.0.1:" + std::to_string(port) +
                                   "/health",
                               {}, std::chrono::milliseconds(500)),
                    std::runtime_error);
}
