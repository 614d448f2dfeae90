#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace infergate {

struct LaunchRequest {
  std::filesystem::path executable;
  std::vector<std::string> args; // without argv[0]
  // Variables set (or replaced) on top of the parent's environment.
  std::map<std::string, std::string> env;
  // Bytes of stderr kept for diagnostics.
  std::size_t stderr_capacity{64 * 1024};
};

// Handle to a spawned server process. Destroying the handle kills a process
// that is still running.
class ServerProcess {
public:
  virtual ~ServerProcess() = default;

  virtual int pid() const = 0;
  // Reaps the child if it has exited.
  virtual bool IsRunning() = 0;
  // Exit code, or 128 + signal number; nullopt while running.
  virtual std::optional<int> ExitStatus() = 0;
  // Last `max_bytes` of captured stderr. Once the process has exited this
  // includes everything it wrote.
  virtual std::string StderrTail(std::size_t max_bytes) = 0;
  // SIGTERM, wait up to `grace`, then SIGKILL. Returns true when the process
  // exited within the grace period.
  virtual bool Terminate(std::chrono::milliseconds grace) = 0;
  virtual void Kill() = 0;
};

// Spawns server processes and kills stray pids. Injected into the
// orchestrator so tests can observe orphan cleanup.
class ProcessLauncher {
public:
  virtual ~ProcessLauncher() = default;
  // Returns nullptr and fills `error` when the process could not be started.
  virtual std::unique_ptr<ServerProcess> Launch(const LaunchRequest &launch,
                                                std::string &error) = 0;
  // Force-kills a pid this handle does not own. Returns true when a signal
  // was delivered.
  virtual bool KillPid(int pid) = 0;
};

// fork/exec based launcher; children run in their own session.
class PosixProcessLauncher : public ProcessLauncher {
public:
  std::unique_ptr<ServerProcess> Launch(const LaunchRequest &launch,
                                        std::string &error) override;
  bool KillPid(int pid) override;
};

} // namespace infergate
