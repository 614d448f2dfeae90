#include "net/http_client.h"

#include "net/chunked_decoder.h"

#include <cerrno>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace infergate {

Url ParseUrl(const std::string &url) {
  Url out;
  std::string rest = url;
  const auto sep = url.find("://");
  if (sep != std::string::npos) {
    const std::string scheme = url.substr(0, sep);
    if (scheme == "https") {
      out.tls = true;
      out.port = 443;
    } else if (scheme != "http") {
      throw std::runtime_error("unsupported URL scheme: " + url);
    }
    rest = url.substr(sep + 3);
  }

  const auto slash = rest.find_first_of("/?");
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    out.target = rest.substr(slash);
    if (out.target[0] == '?') {
      out.target.insert(0, "/");
    }
  }

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    const std::string port = authority.substr(colon + 1);
    authority.resize(colon);
    if (port.empty() ||
        !std::all_of(port.begin(), port.end(),
                     [](unsigned char c) { return std::isdigit(c); }) ||
        port.size() > 5 || std::stoi(port) == 0 || std::stoi(port) > 65535) {
      throw std::runtime_error("invalid URL port: " + url);
    }
    out.port = std::stoi(port);
  }
  if (authority.empty()) {
    throw std::runtime_error("invalid URL host: " + url);
  }
  out.host = authority;
  return out;
}

namespace {

// One request's socket and optional TLS session; closed on destruction.
class Connection {
public:
  Connection() = default;
  ~Connection() { Close(); }
  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  void Open(const Url &url, std::chrono::milliseconds timeout, SSL_CTX *tls) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *found = nullptr;
    const std::string service = std::to_string(url.port);
    if (::getaddrinfo(url.host.c_str(), service.c_str(), &hints, &found) !=
        0) {
      throw std::runtime_error("failed to resolve host " + url.host);
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    for (addrinfo *ai = found; ai && sock_ < 0; ai = ai->ai_next) {
      int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
      if (fd < 0) {
        continue;
      }
      // The send timeout also bounds connect() on Linux.
      ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
      ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
      if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
        sock_ = fd;
      } else {
        ::close(fd);
      }
    }
    ::freeaddrinfo(found);
    if (sock_ < 0) {
      throw std::runtime_error("failed to connect to " + url.host + ":" +
                               std::to_string(url.port));
    }
    if (url.tls) {
      StartTls(url.host, tls);
    }
  }

  void WriteAll(const std::string &data) {
    std::size_t offset = 0;
    while (offset < data.size()) {
      const char *from = data.data() + offset;
      const std::size_t left = data.size() - offset;
      long written;
      if (ssl_) {
        written = SSL_write(ssl_, from, static_cast<int>(left));
      } else {
        written = ::send(sock_, from, left, MSG_NOSIGNAL);
        if (written < 0 && errno == EINTR) {
          continue;
        }
      }
      if (written <= 0) {
        throw std::runtime_error("failed to send request");
      }
      offset += static_cast<std::size_t>(written);
    }
  }

  // Bytes read, 0 at end of stream, -1 on error (errno set for plain TCP).
  long Read(char *buffer, std::size_t size) {
    for (;;) {
      if (ssl_) {
        const int n = SSL_read(ssl_, buffer, static_cast<int>(size));
        if (n > 0) {
          return n;
        }
        const int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return err == SSL_ERROR_ZERO_RETURN ? 0 : -1;
      }
      const ssize_t n = ::recv(sock_, buffer, size, 0);
      if (n < 0 && errno == EINTR) {
        continue;
      }
      return static_cast<long>(n);
    }
  }

  void Close() {
    if (ssl_) {
      SSL_shutdown(ssl_);
      SSL_free(ssl_);
      ssl_ = nullptr;
    }
    if (sock_ >= 0) {
      ::close(sock_);
      sock_ = -1;
    }
  }

private:
  void StartTls(const std::string &host, SSL_CTX *tls) {
    if (!tls) {
      throw std::runtime_error("TLS is unavailable");
    }
    ssl_ = SSL_new(tls);
    if (!ssl_) {
      throw std::runtime_error("failed to create TLS session");
    }
    SSL_set_tlsext_host_name(ssl_, host.c_str());
#if defined(SSL_set1_host)
    SSL_set1_host(ssl_, host.c_str());
#endif
    SSL_set_fd(ssl_, sock_);
    if (SSL_connect(ssl_) != 1) {
      throw std::runtime_error("TLS handshake with " + host + " failed");
    }
    if (SSL_get_verify_result(ssl_) != X509_V_OK) {
      throw std::runtime_error("certificate of " + host + " not trusted");
    }
  }

  int sock_{-1};
  SSL *ssl_{nullptr};
};

std::string RequestHead(const Url &url, const std::string &method,
                        const std::string &body, const HttpHeaders &headers) {
  std::string head = method + " " + url.target + " HTTP/1.1\r\n";
  head += "Host: " + url.host;
  if (url.port != (url.tls ? 443 : 80)) {
    head += ":" + std::to_string(url.port);
  }
  head += "\r\n";
  if (!body.empty() || method != "GET") {
    head += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  }
  if (!body.empty() && headers.count("Content-Type") == 0) {
    head += "Content-Type: application/json\r\n";
  }
  for (const auto &[name, value] : headers) {
    head += name + ": " + value + "\r\n";
  }
  head += "Connection: close\r\n\r\n";
  return head;
}

std::string Lower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string TrimSpaces(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

// Parses the status line and header block (without the final blank line).
void ParseHead(const std::string &head, HttpResponse &response) {
  std::istringstream lines(head);
  std::string line;
  if (!std::getline(lines, line)) {
    throw std::runtime_error("empty HTTP response");
  }
  auto status_pos = line.find(' ');
  if (line.rfind("HTTP/", 0) != 0 || status_pos == std::string::npos) {
    throw std::runtime_error("malformed HTTP status line");
  }
  try {
    response.status = std::stoi(line.substr(status_pos + 1));
  } catch (const std::exception &) {
    throw std::runtime_error("malformed HTTP status code");
  }
  while (std::getline(lines, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    response.headers[Lower(TrimSpaces(line.substr(0, colon)))] =
        TrimSpaces(line.substr(colon + 1));
  }
}
HttpResponse Collect(const HttpClient &client, const std::string &method,
                     const std::string &url, const std::string &body,
                     const HttpHeaders &headers,
                     std::chrono::milliseconds timeout) {
  std::string collected;
  HttpClient::StreamHandlers handlers;
  handlers.on_body = [&collected](const char *data, std::size_t length) {
    collected.append(data, length);
    return true;
  };
  HttpResponse response =
      client.Stream(method, url, body, headers, timeout, handlers);
  response.body = std::move(collected);
  return response;
}

} // namespace

HttpClient::HttpClient() {
  OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS, nullptr);
  tls_ = SSL_CTX_new(TLS_client_method());
  if (tls_) {
    SSL_CTX_set_verify(tls_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(tls_);
  }
}

HttpClient::~HttpClient() {
  if (tls_) {
    SSL_CTX_free(tls_);
  }
}

HttpResponse HttpClient::Get(const std::string &url,
                             const HttpHeaders &headers,
                             std::chrono::milliseconds timeout) const {
  return Collect(*this, "GET", url, "", headers, timeout);
}

HttpResponse HttpClient::Post(const std::string &url, const std::string &body,
                              const HttpHeaders &headers,
                              std::chrono::milliseconds timeout) const {
  return Collect(*this, "POST", url, body, headers, timeout);
}

HttpResponse HttpClient::Stream(const std::string &method,
                                const std::string &url,
                                const std::string &body,
                                const HttpHeaders &headers,
                                std::chrono::milliseconds timeout,
                                const StreamHandlers &handlers) const {
  const Url target = ParseUrl(url);
  Connection conn;
  conn.Open(target, timeout, tls_);
  conn.WriteAll(RequestHead(target, method, body, headers) + body);

  HttpResponse response;
  std::string head;
  bool head_done = false;
  bool chunked = false;
  long long content_length = -1;
  long long delivered = 0;
  ChunkedDecoder decoder;
  std::string decoded;

  // Hands body bytes to the caller; returns false when reading should stop.
  auto deliver = [&](const char *data, std::size_t length) -> bool {
    if (chunked) {
      decoded.clear();
      decoder.Feed(data, length, decoded);
      if (!decoded.empty() && handlers.on_body &&
          !handlers.on_body(decoded.data(), decoded.size())) {
        return false;
      }
      return !decoder.Done();
    }
    if (content_length >= 0) {
      length = static_cast<std::size_t>(
          std::min<long long>(static_cast<long long>(length),
                              content_length - delivered));
    }
    delivered += static_cast<long long>(length);
    if (length > 0 && handlers.on_body && !handlers.on_body(data, length)) {
      return false;
    }
    return content_length < 0 || delivered < content_length;
  };

  char buffer[8192];
  bool keep_reading = true;
  while (keep_reading) {
    const long received = conn.Read(buffer, sizeof(buffer));
    if (received < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        throw std::runtime_error("timed out after " +
                               std::to_string(timeout.count()) +
                               " ms waiting for " + url);
      }
      throw std::runtime_error("failed to read response from " + url);
    }
    if (received == 0) {
      break;
    }
    if (head_done) {
      keep_reading = deliver(buffer, static_cast<std::size_t>(received));
      continue;
    }
    head.append(buffer, static_cast<std::size_t>(received));
    auto header_end = head.find("\r\n\r\n");
    if (header_end == std::string::npos) {
      if (head.size() > 64 * 1024) {
        throw std::runtime_error("HTTP response header too large");
      }
      continue;
    }
    std::string rest = head.substr(header_end + 4);
    head.resize(header_end);
    ParseHead(head, response);
    head_done = true;
    auto te = response.headers.find("transfer-encoding");
    chunked = te != response.headers.end() &&
              Lower(te->second).find("chunked") != std::string::npos;
    auto cl = response.headers.find("content-length");
    if (!chunked && cl != response.headers.end()) {
      try {
        content_length = std::stoll(cl->second);
      } catch (const std::exception &) {
        content_length = -1;
      }
    }
    if (handlers.on_headers &&
        !handlers.on_headers(response.status, response.headers)) {
      break;
    }
    if (content_length == 0) {
      break;
    }
    if (!rest.empty()) {
      keep_reading = deliver(rest.data(), rest.size());
    }
  }
  conn.Close();
  if (!head_done) {
    throw std::runtime_error("connection closed before HTTP response from " +
                             url);
  }
  return response;
}

} // namespace infergate
