#pragma once

#include "orchestrator/server_process.h"

#include <sys/types.h>

#include <mutex>
#include <thread>

namespace infergate {

struct ChildOptions {
  std::filesystem::path executable;
  std::vector<std::string> args; // without argv[0]
  std::map<std::string, std::string> env;
  bool pipe_stdin{false};  // otherwise /dev/null
  bool pipe_stdout{false}; // otherwise /dev/null
  std::size_t stderr_capacity{64 * 1024};
};

// A POSIX child process started with fork/execve in a new session. stderr is
// drained by a reader thread into a bounded buffer; stdin/stdout can be piped
// for line-oriented protocols.
class ChildProcess : public ServerProcess {
public:
  enum class ReadStatus { kLine, kTimeout, kEof };

  // Returns nullptr and fills `error` if the pipes, fork or exec fail.
  static std::unique_ptr<ChildProcess> Spawn(const ChildOptions &options,
                                             std::string &error);

  ~ChildProcess() override;
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  int pid() const override { return static_cast<int>(pid_); }
  bool IsRunning() override;
  std::optional<int> ExitStatus() override;
  std::string StderrTail(std::size_t max_bytes) override;
  bool Terminate(std::chrono::milliseconds grace) override;
  void Kill() override;

  // Polls for exit every 10 ms. Returns true once the child has been reaped.
  bool WaitForExit(std::chrono::milliseconds timeout);

  // Writes `line` plus '\n' to the child's stdin.
  bool WriteLine(const std::string &line);
  void CloseStdin();
  // Reads one '\n'-terminated line from the child's stdout.
  ReadStatus ReadLine(std::string &line, std::chrono::milliseconds timeout);

private:
  ChildProcess() = default;

  void ReadStderrLoop();
  void JoinStderrReader();
  // Non-blocking waitpid; records the status when the child has exited.
  bool Reap();

  pid_t pid_{-1};
  int stdin_fd_{-1};
  int stdout_fd_{-1};
  int stderr_fd_{-1};
  std::size_t stderr_capacity_{64 * 1024};
  std::string stdout_buffer_;
  bool stdout_eof_{false};

  std::mutex state_mutex_;
  bool exited_{false};
  int exit_status_{0};

  mutable std::mutex stderr_mutex_;
  std::string stderr_buffer_;
  std::mutex join_mutex_;
  std::thread stderr_thread_;
};

} // namespace infergate
