#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "log.hpp"
#include "progress_parser.hpp"
#include "storage_service.hpp"
#include "task.hpp"
#include "task_registry.hpp"

struct UploadResult {
  enum class Status { Success, Failure, Cancelled };

  Status status = Status::Failure;
  TaskError error = TaskError::None;
  std::string remote_id;
  std::string view_link;
  std::string message;
};

const char* to_string(UploadResult::Status status);

// Drives a resumable upload one chunk at a time, checking for cancellation at
// every chunk boundary.
class UploadDriver {
public:
  using Clock = std::chrono::steady_clock;

  struct Options {
    std::string container_id;
    std::function<Clock::time_point()> now;
  };

  using ProgressCallback = std::function<void(const ProgressSnapshot& snapshot, bool final)>;

  UploadDriver(Options options,
               std::shared_ptr<CredentialProvider> credentials,
               std::shared_ptr<StorageService> storage,
               std::shared_ptr<Logger> logger = nullptr);

  UploadResult run(Task& task,
                   const std::filesystem::path& file,
                   const CancellationToken& token,
                   const ProgressCallback& on_progress);

private:
  UploadResult cancelled_result(const Task& task) const;
  UploadResult failure(TaskError error, std::string message) const;
  Clock::time_point now() const;

  Options options_;
  std::shared_ptr<CredentialProvider> credentials_;
  std::shared_ptr<StorageService> storage_;
  std::shared_ptr<Logger> logger_;
};
