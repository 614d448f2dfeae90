#include "orchestrator/child_process.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

extern char **environ;

namespace infergate {

namespace {

std::once_flag g_ignore_sigpipe;

void ClosePipe(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      ::close(fds[i]);
      fds[i] = -1;
    }
  }
}

// Converts a list of strings into a null-terminated char* array. The strings
// must outlive the array.
std::vector<char *> ToCharPtrArray(std::vector<std::string> &values) {
  std::vector<char *> out;
  out.reserve(values.size() + 1);
  for (auto &value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

std::vector<std::string>
MergeEnvironment(const std::map<std::string, std::string> &overrides) {
  std::vector<std::string> env;
  for (char **it = environ; it && *it; ++it) {
    std::string entry(*it);
    auto eq = entry.find('=');
    std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
    if (overrides.count(key) == 0) {
      env.push_back(std::move(entry));
    }
  }
  for (const auto &[key, value] : overrides) {
    env.push_back(key + "=" + value);
  }
  return env;
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const ChildOptions &options,
                                                  std::string &error) {
  // A child that exits while we write to its stdin must not kill us.
  std::call_once(g_ignore_sigpipe, [] { ::signal(SIGPIPE, SIG_IGN); });

  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  auto close_all = [&] {
    ClosePipe(stdin_pipe);
    ClosePipe(stdout_pipe);
    ClosePipe(stderr_pipe);
    ClosePipe(exec_pipe);
  };
  if ((options.pipe_stdin && ::pipe2(stdin_pipe, O_CLOEXEC) < 0) ||
      (options.pipe_stdout && ::pipe2(stdout_pipe, O_CLOEXEC) < 0) ||
      ::pipe2(stderr_pipe, O_CLOEXEC) < 0 ||
      ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
    error = std::string("failed to create pipes: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  // Everything the child touches is prepared before fork().
  std::vector<std::string> argv_storage;
  argv_storage.push_back(options.executable.string());
  argv_storage.insert(argv_storage.end(), options.args.begin(),
                      options.args.end());
  std::vector<std::string> env_storage = MergeEnvironment(options.env);
  std::vector<char *> argv = ToCharPtrArray(argv_storage);
  std::vector<char *> envp = ToCharPtrArray(env_storage);
  const std::string exe = options.executable.string();

  pid_t pid = ::fork();
  if (pid < 0) {
    error = std::string("fork() failed: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  if (pid == 0) {
    ::setsid();
    int devnull = ::open("/dev/null", O_RDWR);
    ::dup2(options.pipe_stdin ? stdin_pipe[0] : devnull, STDIN_FILENO);
    ::dup2(options.pipe_stdout ? stdout_pipe[1] : devnull, STDOUT_FILENO);
    ::dup2(stderr_pipe[1], STDERR_FILENO);
    ::execve(exe.c_str(), argv.data(), envp.data());
    int err = errno;
    ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  // Parent: keep our ends only.
  ::close(exec_pipe[1]);
  exec_pipe[1] = -1;
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(exec_pipe[0]);
  exec_pipe[0] = -1;

  std::unique_ptr<ChildProcess> child(new ChildProcess());
  child->pid_ = pid;
  child->stderr_capacity_ = options.stderr_capacity;
  if (options.pipe_stdin) {
    ::close(stdin_pipe[0]);
    child->stdin_fd_ = stdin_pipe[1];
  }
  if (options.pipe_stdout) {
    ::close(stdout_pipe[1]);
    child->stdout_fd_ = stdout_pipe[0];
  }
  ::close(stderr_pipe[1]);
  child->stderr_fd_ = stderr_pipe[0];

  if (n > 0) {
    // exec failed; the child already called _exit(127).
    error = "failed to execute " + exe + ": " + std::strerror(child_errno);
    child->WaitForExit(std::chrono::milliseconds(1000));
    return nullptr;
  }

  child->stderr_thread_ = std::thread([raw = child.get()] {
    raw->ReadStderrLoop();
  });
  return child;
}

ChildProcess::~ChildProcess() {
  if (pid_ > 0 && IsRunning()) {
    Kill();
  }
  CloseStdin();
  if (stdout_fd_ >= 0) {
    ::close(stdout_fd_);
    stdout_fd_ = -1;
  }
  JoinStderrReader();
  if (stderr_fd_ >= 0) {
    ::close(stderr_fd_);
    stderr_fd_ = -1;
  }
}

void ChildProcess::ReadStderrLoop() {
  char buffer[4096];
  while (true) {
    ssize_t n = ::read(stderr_fd_, buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    stderr_buffer_.append(buffer, static_cast<std::size_t>(n));
    if (stderr_buffer_.size() > stderr_capacity_) {
      stderr_buffer_.erase(0, stderr_buffer_.size() - stderr_capacity_);
    }
  }
}

bool ChildProcess::Reap() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (exited_) {
    return true;
  }
  int status = 0;
  pid_t result = ::waitpid(pid_, &status, WNOHANG);
  if (result == pid_) {
    exited_ = true;
    exit_status_ = WIFEXITED(status)     ? WEXITSTATUS(status)
                   : WIFSIGNALED(status) ? 128 + WTERMSIG(status)
                                         : -1;
    return true;
  }
  if (result < 0 && errno == ECHILD) {
    // Reaped elsewhere; treat as gone.
    exited_ = true;
    exit_status_ = -1;
    return true;
  }
  return false;
}

bool ChildProcess::IsRunning() { return !Reap(); }

std::optional<int> ChildProcess::ExitStatus() {
  if (!Reap()) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(state_mutex_);
  return exit_status_;
}

void ChildProcess::JoinStderrReader() {
  // The reader sees EOF once the child (and anything inheriting its stderr)
  // is gone.
  std::lock_guard<std::mutex> lock(join_mutex_);
  if (stderr_thread_.joinable()) {
    stderr_thread_.join();
  }
}

std::string ChildProcess::StderrTail(std::size_t max_bytes) {
  if (Reap()) {
    JoinStderrReader();
  }
  std::lock_guard<std::mutex> lock(stderr_mutex_);
  if (stderr_buffer_.size() <= max_bytes) {
    return stderr_buffer_;
  }
  return stderr_buffer_.substr(stderr_buffer_.size() - max_bytes);
}

bool ChildProcess::WaitForExit(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (Reap()) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

bool ChildProcess::Terminate(std::chrono::milliseconds grace) {
  if (Reap()) {
    return true;
  }
  if (::kill(pid_, SIGTERM) == 0 && WaitForExit(grace)) {
    return true;
  }
  Kill();
  return false;
}

void ChildProcess::Kill() {
  if (Reap()) {
    return;
  }
  ::kill(pid_, SIGKILL);
  WaitForExit(std::chrono::milliseconds(5000));
}

bool ChildProcess::WriteLine(const std::string &line) {
  if (stdin_fd_ < 0) {
    return false;
  }
  std::string payload = line + "\n";
  const char *ptr = payload.data();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    ssize_t n = ::write(stdin_fd_, ptr, remaining);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    ptr += n;
    remaining -= static_cast<std::size_t>(n);
  }
  return true;
}

void ChildProcess::CloseStdin() {
  if (stdin_fd_ >= 0) {
    ::close(stdin_fd_);
    stdin_fd_ = -1;
  }
}

ChildProcess::ReadStatus
ChildProcess::ReadLine(std::string &line, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto newline = stdout_buffer_.find('\n');
    if (newline != std::string::npos) {
      line = stdout_buffer_.substr(0, newline);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      stdout_buffer_.erase(0, newline + 1);
      return ReadStatus::kLine;
    }
    if (stdout_eof_ || stdout_fd_ < 0) {
      if (!stdout_buffer_.empty()) {
        line.swap(stdout_buffer_);
        stdout_buffer_.clear();
        return ReadStatus::kLine;
      }
      return ReadStatus::kEof;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return ReadStatus::kTimeout;
    }
    pollfd pfd{stdout_fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0 && errno == EINTR) {
      continue;
    }
    if (ready <= 0) {
      return ready == 0 ? ReadStatus::kTimeout : ReadStatus::kEof;
    }
    char buffer[4096];
    ssize_t n = ::read(stdout_fd_, buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      stdout_eof_ = true;
      continue;
    }
    stdout_buffer_.append(buffer, static_cast<std::size_t>(n));
  }
}

std::unique_ptr<ServerProcess>
PosixProcessLauncher::Launch(const LaunchRequest &launch, std::string &error) {
  ChildOptions options;
  options.executable = launch.executable;
  options.args = launch.args;
  options.env = launch.env;
  options.stderr_capacity = launch.stderr_capacity;
  return ChildProcess::Spawn(options, error);
}

bool PosixProcessLauncher::KillPid(int pid) {
  if (pid <= 0) {
    return false;
  }
  if (::kill(static_cast<pid_t>(pid), SIGKILL) != 0) {
    return false;
  }
  // Reap it if it happens to be our own child.
  int status = 0;
  ::waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
  return true;
}

} // namespace infergate
