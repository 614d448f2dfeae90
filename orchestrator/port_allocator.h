#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace infergate {

// Hands out local TCP ports from [first, last]. A candidate is taken only if
// no other server holds it and a bind() test on the host succeeds.
class PortAllocator {
public:
  PortAllocator(std::string host = "127.0.0.1", int first = 8080,
                int last = 8179);

  // First free port in range, now reserved; nullopt when exhausted.
  std::optional<int> Acquire();
  // Reserves a specific port; false if held or not bindable.
  bool Reserve(int port);
  void Release(int port);

  bool IsReserved(int port) const;
  std::set<int> Reserved() const;

  int first() const { return first_; }
  int last() const { return last_; }

  // True when `port` can currently be bound on `host`.
  static bool IsBindable(const std::string &host, int port);

private:
  std::string host_;
  int first_;
  int last_;
  mutable std::mutex mutex_;
  std::set<int> reserved_;
};

} // namespace infergate
