#include "orchestrator/port_allocator.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>

namespace infergate {

PortAllocator::PortAllocator(std::string host, int first, int last)
    : host_(std::move(host)), first_(first), last_(last) {}

bool PortAllocator::IsBindable(const std::string &host, int port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;
  addrinfo *result = nullptr;
  if (getaddrinfo(host.empty() ? nullptr : host.c_str(),
                  std::to_string(port).c_str(), &hints, &result) != 0) {
    return false;
  }
  bool bindable = false;
  for (addrinfo *rp = result; rp != nullptr && !bindable; rp = rp->ai_next) {
    int sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock < 0) {
      continue;
    }
    // Matches llama-server, which also binds with SO_REUSEADDR.
    int one = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    bindable = ::bind(sock, rp->ai_addr, rp->ai_addrlen) == 0;
    ::close(sock);
  }
  freeaddrinfo(result);
  return bindable;
}

std::optional<int> PortAllocator::Acquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (int port = first_; port <= last_; ++port) {
    if (reserved_.count(port)) {
      continue;
    }
    if (IsBindable(host_, port)) {
      reserved_.insert(port);
      return port;
    }
  }
  return std::nullopt;
}

bool PortAllocator::Reserve(int port) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (reserved_.count(port) || !IsBindable(host_, port)) {
    return false;
  }
  reserved_.insert(port);
  return true;
}

void PortAllocator::Release(int port) {
  std::lock_guard<std::mutex> lock(mutex_);
  reserved_.erase(port);
}

bool PortAllocator::IsReserved(int port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserved_.count(port) > 0;
}

std::set<int> PortAllocator::Reserved() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserved_;
}

} // namespace infergate
