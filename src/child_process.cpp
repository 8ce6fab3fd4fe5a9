#include "child_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

namespace {

void close_fd(int& fd) {
  if(fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct PipePair {
  int read_end = -1;
  int write_end = -1;

  PipePair() {
    int fds[2];
    if(::pipe2(fds, O_CLOEXEC) != 0) {
      throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    read_end = fds[0];
    write_end = fds[1];
  }
  ~PipePair() {
    close_fd(read_end);
    close_fd(write_end);
  }
  int take_read() { int fd = read_end; read_end = -1; return fd; }
};

int decode_status(int status) {
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

std::shared_ptr<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& argv,
                                                  std::string& error) {
  if(argv.empty() || argv.front().empty()) {
    error = "no program given";
    return nullptr;
  }

  PipePair out;
  PipePair err;
  PipePair exec_status;

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for(const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  const pid_t pid = ::fork();
  if(pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }

  if(pid == 0) {
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if(devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(out.write_end, STDOUT_FILENO);
    ::dup2(err.write_end, STDERR_FILENO);
    ::execvp(args[0], args.data());
    const int code = errno;
    ssize_t ignored = ::write(exec_status.write_end, &code, sizeof(code));
    (void)ignored;
    ::_exit(127);
  }

  // Both sides set the group so it exists before either continues.
  ::setpgid(pid, pid);
  close_fd(out.write_end);
  close_fd(err.write_end);
  close_fd(exec_status.write_end);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_status.read_end, &exec_errno, sizeof(exec_errno));
  } while(n < 0 && errno == EINTR);

  if(n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    while(::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    error = "cannot execute '" + argv.front() + "': " + std::strerror(exec_errno);
    return nullptr;
  }

  return std::shared_ptr<ChildProcess>(new ChildProcess(pid, out.take_read(), err.take_read()));
}

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
  : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() {
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
  if(running()) {
    terminate_tree(std::chrono::milliseconds(0));
  }
}

int ChildProcess::release_stdout() {
  std::lock_guard<std::mutex> lock(mutex_);
  int fd = stdout_fd_;
  stdout_fd_ = -1;
  return fd;
}

int ChildProcess::release_stderr() {
  std::lock_guard<std::mutex> lock(mutex_);
  int fd = stderr_fd_;
  stderr_fd_ = -1;
  return fd;
}

bool ChildProcess::reap_locked(bool block) {
  if(reaped_) return true;
  int status = 0;
  pid_t result;
  do {
    result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while(result < 0 && errno == EINTR);

  if(result == pid_) {
    reaped_ = true;
    exit_code_ = decode_status(status);
  } else if(result < 0) {
    // ECHILD: someone else reaped it; nothing left to wait for.
    reaped_ = true;
    exit_code_ = -1;
  }
  return reaped_;
}

void ChildProcess::signal_group(int signo) const {
  if(::kill(-pid_, signo) != 0 && errno == ESRCH) {
    ::kill(pid_, signo);
  }
}

std::optional<int> ChildProcess::try_wait() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(reap_locked(false)) return exit_code_;
  return std::nullopt;
}

bool ChildProcess::running() {
  return !try_wait().has_value();
}

void ChildProcess::terminate_tree(std::chrono::milliseconds grace) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(pid_ <= 0 || terminated_) return;
  terminated_ = true;

  if(!reap_locked(false)) {
    signal_group(SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while(!reap_locked(false) && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if(!reaped_) {
      signal_group(SIGKILL);
      reap_locked(true);
    }
  }
  // descendants that outlived the leader
  ::kill(-pid_, SIGKILL);
}
