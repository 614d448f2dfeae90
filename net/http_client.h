#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

#include <openssl/ssl.h>

namespace infergate {

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
  int status{0};
  // Header names are lower-cased.
  HttpHeaders headers;
  // Body with any chunked transfer encoding already removed.
  std::string body;

  bool Ok() const { return status >= 200 && status < 300; }
};

struct Url {
  bool tls{false};
  std::string host;
  int port{80};
  std::string target{"/"}; // path and query
};

// Accepts http:// and https:// URLs; a missing scheme means http. Throws
// std::runtime_error for other schemes, an empty host or a bad port.
Url ParseUrl(const std::string &url);

// Blocking HTTP/1.1 client. One connection per request ("Connection: close").
// Transport failures (resolve, connect, TLS, send, timeout) throw
// std::runtime_error; any HTTP status is returned as a response.
class HttpClient {
public:
  static constexpr std::chrono::milliseconds kDefaultTimeout{30000};

  // Callbacks for Stream(). on_headers runs once, before any body bytes, and
  // on_body receives de-chunked body fragments as they arrive. Returning
  // false from either callback closes the connection early.
  struct StreamHandlers {
    std::function<bool(int status, const HttpHeaders &headers)> on_headers;
    std::function<bool(const char *data, std::size_t length)> on_body;
  };

  HttpClient();
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse Get(const std::string &url, const HttpHeaders &headers = {},
                   std::chrono::milliseconds timeout = kDefaultTimeout) const;
  HttpResponse Post(const std::string &url, const std::string &body,
                    const HttpHeaders &headers = {},
                    std::chrono::milliseconds timeout = kDefaultTimeout) const;

  // Sends the request and reads the response incrementally. Returns the
  // status and headers; the body is only delivered through the handlers.
  HttpResponse Stream(const std::string &method, const std::string &url,
                      const std::string &body, const HttpHeaders &headers,
                      std::chrono::milliseconds timeout,
                      const StreamHandlers &handlers) const;

private:
  // Client TLS context with peer verification against the system store;
  // null when OpenSSL could not create one.
  SSL_CTX *tls_{nullptr};
};

} // namespace infergate
