#include "process_runner.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <deque>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr std::size_t kTailLines = 20;
constexpr int kExecFailedExitCode = 127;

class LineSplitter {
public:
  LineSplitter(const ProcessLineCallback& on_line, std::deque<std::string>& tail)
    : on_line_(on_line), tail_(tail) {}

  void feed(const char* data, std::size_t size) {
    for(std::size_t i = 0; i < size; ++i) {
      char ch = data[i];
      if(ch == '\n' || ch == '\r') {
        flush();
      } else {
        current_.push_back(ch);
      }
    }
  }

  void flush() {
    if(current_.empty()) return;
    tail_.push_back(current_);
    if(tail_.size() > kTailLines) tail_.pop_front();
    if(on_line_) on_line_(current_);
    current_.clear();
  }

private:
  const ProcessLineCallback& on_line_;
  std::deque<std::string>& tail_;
  std::string current_;
};

// Owns the read end of the output pipe and the child. Unless released, the
// destructor closes the pipe, kills the child and reaps it, so an exception
// from the line callback never leaves a blocked or zombie process behind.
class ChildGuard {
public:
  ChildGuard(pid_t pid, int read_fd) : pid_(pid), read_fd_(read_fd) {}
  ~ChildGuard() {
    close_pipe();
    if(pid_ > 0) {
      ::kill(pid_, SIGKILL);
      int status = 0;
      while(::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }
  }

  ChildGuard(const ChildGuard&) = delete;
  ChildGuard& operator=(const ChildGuard&) = delete;

  int read_fd() const { return read_fd_; }

  void close_pipe() {
    if(read_fd_ >= 0) {
      ::close(read_fd_);
      read_fd_ = -1;
    }
  }

  // Waits for a normal exit; afterwards the destructor has nothing to reap.
  int wait() {
    int status = 0;
    while(::waitpid(pid_, &status, 0) < 0) {
      if(errno != EINTR) {
        int err = errno;
        pid_ = -1;
        throw std::system_error(err, std::generic_category(), "waitpid");
      }
    }
    pid_ = -1;
    return status;
  }

private:
  pid_t pid_;
  int read_fd_;
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(int write_fd, char* const* argv, bool background_priority) {
  int devnull = ::open("/dev/null", O_RDONLY);
  if(devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::close(devnull);
  }
  ::dup2(write_fd, STDOUT_FILENO);
  ::dup2(write_fd, STDERR_FILENO);
  ::close(write_fd);

  if(background_priority) {
    ::setpriority(PRIO_PROCESS, 0, 19);
    ::syscall(SYS_ioprio_set, 1, 0, 3 << 13);
  }

  ::execvp(argv[0], argv);
  const char* prefix = "exec failed: ";
  ::write(STDERR_FILENO, prefix, std::strlen(prefix));
  ::write(STDERR_FILENO, argv[0], std::strlen(argv[0]));
  ::write(STDERR_FILENO, "\n", 1);
  ::_exit(kExecFailedExitCode);
}

} // namespace

std::string ProcessResult::tail_text() const {
  std::string out;
  for(const auto& line : tail) {
    if(!out.empty()) out += '\n';
    out += line;
  }
  return out;
}

ProcessResult run_process(const ProcessRequest& request, const ProcessLineCallback& on_line) {
  if(request.argv.empty() || request.argv.front().empty()) {
    throw std::invalid_argument("run_process: empty command line");
  }

  std::vector<char*> argv;
  argv.reserve(request.argv.size() + 1);
  for(const auto& arg : request.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  int fds[2];
  if(::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }

  pid_t pid = ::fork();
  if(pid < 0) {
    int err = errno;
    ::close(fds[0]);
    ::close(fds[1]);
    throw std::system_error(err, std::generic_category(), "fork");
  }
  if(pid == 0) {
    ::close(fds[0]);
    exec_child(fds[1], argv.data(), request.background_priority);
  }

  ::close(fds[1]);
  ChildGuard child(pid, fds[0]);
  std::deque<std::string> tail;
  LineSplitter splitter(on_line, tail);
  char buffer[4096];
  int read_errno = 0;
  for(;;) {
    ssize_t n = ::read(child.read_fd(), buffer, sizeof(buffer));
    if(n < 0) {
      if(errno == EINTR) continue;
      read_errno = errno;
      break;
    }
    if(n == 0) break;
    splitter.feed(buffer, static_cast<std::size_t>(n));
  }
  splitter.flush();
  child.close_pipe();

  int status = child.wait();
  if(read_errno != 0) {
    throw std::system_error(read_errno, std::generic_category(), "read from " + request.argv.front());
  }

  ProcessResult result;
  if(WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if(WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  result.tail.assign(tail.begin(), tail.end());
  return result;
}

ProcessLauncher default_process_launcher() {
  return [](const ProcessRequest& request, const ProcessLineCallback& on_line) {
    return run_process(request, on_line);
  };
}
