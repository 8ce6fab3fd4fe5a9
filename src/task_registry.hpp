#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "task.hpp"

class ChildProcess;
class TaskRegistry;

// Cooperative cancellation: a task is cancelled once it is no longer registered.
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(std::shared_ptr<const TaskRegistry> registry, std::string task_id);

  bool cancelled() const;
  const std::string& task_id() const { return task_id_; }

private:
  std::shared_ptr<const TaskRegistry> registry_;
  std::string task_id_;
};

struct CancelResult {
  bool found = false;
  std::shared_ptr<Task> task;
  bool process_terminated = false;
  std::size_t artifacts_removed = 0;
};

struct TaskSummary {
  std::string id;
  std::string display_name;
  TaskState state = TaskState::Created;
  bool has_process = false;
};

// In-flight tasks keyed by id. Mutations are serialized; lookups never wait on
// process termination or file removal.
class TaskRegistry {
public:
  explicit TaskRegistry(std::chrono::milliseconds terminate_grace = std::chrono::milliseconds(2000),
                        std::shared_ptr<Logger> logger = nullptr);

  bool register_task(std::shared_ptr<Task> task, std::string& error);
  bool contains(const std::string& id) const;
  std::shared_ptr<Task> find(const std::string& id) const;

  // False when the task is no longer registered; the caller then owns shutdown.
  bool attach_process(const std::string& id, std::shared_ptr<ChildProcess> process);
  void detach_process(const std::string& id);

  CancelResult cancel(const std::string& id);
  // Removes the entry. Returns the task when it was present, nullptr otherwise.
  std::shared_ptr<Task> finalize(const std::string& id);

  std::vector<TaskSummary> snapshot() const;
  std::vector<std::string> ids() const;
  std::size_t size() const;

  // Exact id, or the single registered id starting with the given prefix.
  std::optional<std::string> resolve(const std::string& id_or_prefix, std::string& error) const;

private:
  struct Entry {
    std::shared_ptr<Task> task;
    std::shared_ptr<ChildProcess> process;
  };

  std::chrono::milliseconds terminate_grace_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};
