#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "notification_sink.hpp"

class Logger;

enum class TaskState { Created, Downloading, Uploading, Completed, Failed, Cancelled };

const char* to_string(TaskState state);
bool is_terminal(TaskState state);

enum class TaskError {
  None,
  InvalidInput,
  AuthFailure,
  RetrievalFailure,
  TransferFailure,
  Cancelled,
  NotifierFailure
};

const char* to_string(TaskError error);

// "best", "1080", "720", "480"
const std::vector<std::string>& quality_choices();
// Maps a quality tier to the retriever's format selector.
bool quality_selector_for(const std::string& choice, std::string& selector, std::string& error);

class Task {
public:
  Task(std::string id,
       std::string source_url,
       std::string display_name,
       std::string quality_selector,
       MessageTarget target,
       std::filesystem::path output_path,
       std::string remote_name);

  const std::string& id() const { return id_; }
  std::string short_id() const { return id_.substr(0, 8); }
  const std::string& source_url() const { return source_url_; }
  const std::string& display_name() const { return display_name_; }
  const std::string& quality_selector() const { return quality_selector_; }
  const MessageTarget& target() const { return target_; }
  const std::filesystem::path& output_path() const { return output_path_; }
  const std::string& remote_name() const { return remote_name_; }

  TaskState state() const { return state_.load(std::memory_order_acquire); }
  void set_state(TaskState state) { state_.store(state, std::memory_order_release); }

  // The output file plus the retriever's in-progress siblings.
  std::vector<std::filesystem::path> artifact_paths() const;

private:
  const std::string id_;
  const std::string source_url_;
  const std::string display_name_;
  const std::string quality_selector_;
  const MessageTarget target_;
  const std::filesystem::path output_path_;
  const std::string remote_name_;
  std::atomic<TaskState> state_{TaskState::Created};
};

// Returns the number of files removed. Failures are logged.
std::size_t remove_artifacts(const Task& task, Logger* logger);

struct TaskOutcome {
  std::string task_id;
  std::string display_name;
  TaskState state = TaskState::Failed;
  TaskError error = TaskError::None;
  std::string message;
  std::string remote_id;
  std::string view_link;
  std::chrono::system_clock::time_point finished_at{};
};
