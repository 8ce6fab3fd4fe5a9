#pragma once

#include <asio.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "download_driver.hpp"
#include "log.hpp"
#include "rate_limited_notifier.hpp"
#include "task.hpp"
#include "task_registry.hpp"
#include "upload_driver.hpp"

// A job waiting for its quality choice. Its id becomes the task id.
struct PendingJob {
  std::string id;
  std::string source_url;
  std::string display_name;
  MessageTarget target;
};

struct PrepareResult {
  bool ok = false;
  TaskError error = TaskError::None;
  std::string message;
  std::string job_id;
  std::string display_name;
};

struct SubmitResult {
  bool ok = false;
  TaskError error = TaskError::None;
  std::string message;
  std::string task_id;
};

class TaskOrchestrator {
public:
  struct Options {
    std::filesystem::path work_dir = "downloads";
    std::size_t max_parallel_tasks = 8;
    std::string mirror_link_template;
    std::size_t history_limit = 64;
  };

  using CompletionCallback = std::function<void(const TaskOutcome&)>;

  TaskOrchestrator(Options options,
                   std::shared_ptr<TaskRegistry> registry,
                   std::shared_ptr<DownloadDriver> download,
                   std::shared_ptr<UploadDriver> upload,
                   std::shared_ptr<RateLimitedNotifier> notifier,
                   std::shared_ptr<Logger> logger = nullptr);
  ~TaskOrchestrator();

  TaskOrchestrator(const TaskOrchestrator&) = delete;
  TaskOrchestrator& operator=(const TaskOrchestrator&) = delete;

  // Validates the url and resolves the display name (asking the retriever when
  // none is given), then offers the quality tiers on target.
  PrepareResult prepare(const std::string& url,
                        const std::string& display_name,
                        const MessageTarget& target);

  // Consumes the pending job, creates the task and queues it.
  SubmitResult select_quality(const std::string& job_id, const std::string& choice);

  CancelResult cancel(const std::string& task_id);
  std::size_t cancel_all();

  // Removes the task from the registry and deletes its artifacts.
  // False when the task was already gone.
  bool finalize(const std::string& task_id);

  void wait_idle();
  bool wait_idle_for(std::chrono::milliseconds timeout);
  std::size_t running_units() const;

  std::vector<TaskSummary> active_tasks() const;
  std::vector<PendingJob> pending_jobs() const;
  std::vector<TaskOutcome> history() const;
  std::optional<TaskOutcome> outcome(const std::string& task_id) const;

  void set_completion_callback(CompletionCallback callback);

  std::shared_ptr<TaskRegistry> registry() const { return registry_; }
  std::shared_ptr<RateLimitedNotifier> notifier() const { return notifier_; }
  const Options& options() const { return options_; }

  static bool validate_url(const std::string& url, std::string& error);

private:
  class FinalizeGuard;

  void run_unit(std::shared_ptr<Task> task);
  TaskOutcome execute(const std::shared_ptr<Task>& task);
  void finalize_task(const Task& task);
  void record(const TaskOutcome& outcome);

  TaskOutcome make_outcome(const Task& task, TaskState state, TaskError error, std::string message) const;
  std::vector<MessageAction> cancel_actions(const Task& task) const;
  std::vector<MessageAction> link_actions(const std::string& remote_id, const std::string& view_link) const;

  Options options_;
  std::shared_ptr<TaskRegistry> registry_;
  std::shared_ptr<DownloadDriver> download_;
  std::shared_ptr<UploadDriver> upload_;
  std::shared_ptr<RateLimitedNotifier> notifier_;
  std::shared_ptr<Logger> logger_;

  asio::thread_pool pool_;

  mutable std::mutex pending_mutex_;
  std::unordered_map<std::string, PendingJob> pending_;

  mutable std::mutex units_mutex_;
  std::condition_variable units_cv_;
  std::size_t running_units_ = 0;

  mutable std::mutex history_mutex_;
  std::deque<TaskOutcome> history_;
  CompletionCallback completion_;
};
