#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// A child started in its own process group so that the whole tree it spawns
// can be signalled at once. Reaping is serialized; every method is safe to call
// from any thread.
class ChildProcess {
public:
  // Throws std::system_error when pipes cannot be created or fork fails.
  // Returns nullptr with error filled when the program cannot be executed.
  static std::shared_ptr<ChildProcess> spawn(const std::vector<std::string>& argv,
                                             std::string& error);

  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  pid_t pid() const { return pid_; }

  // Ownership of the descriptor passes to the caller; -1 once released.
  int release_stdout();
  int release_stderr();

  // Exit code once the child has been reaped; signals map to 128 + signo.
  std::optional<int> try_wait();
  bool running();

  // SIGTERM to the process group, SIGKILL after grace. Idempotent.
  void terminate_tree(std::chrono::milliseconds grace);

private:
  ChildProcess(pid_t pid, int stdout_fd, int stderr_fd);

  bool reap_locked(bool block);
  void signal_group(int signo) const;

  pid_t pid_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  std::mutex mutex_;
  bool reaped_ = false;
  bool terminated_ = false;
  int exit_code_ = -1;
};
