#include "upload_driver.hpp"

#include <stdexcept>

const char* to_string(UploadResult::Status status) {
  switch(status) {
    case UploadResult::Status::Success: return "success";
    case UploadResult::Status::Failure: return "failure";
    case UploadResult::Status::Cancelled: return "cancelled";
  }
  return "unknown";
}

UploadDriver::UploadDriver(Options options,
                           std::shared_ptr<CredentialProvider> credentials,
                           std::shared_ptr<StorageService> storage,
                           std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    credentials_(std::move(credentials)),
    storage_(std::move(storage)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("upload")) {}

UploadDriver::Clock::time_point UploadDriver::now() const {
  return options_.now ? options_.now() : Clock::now();
}

UploadResult UploadDriver::cancelled_result(const Task& task) const {
  logger_->info("Upload for task {} cancelled", task.id());
  UploadResult result;
  result.status = UploadResult::Status::Cancelled;
  result.error = TaskError::Cancelled;
  result.message = "cancelled";
  return result;
}

UploadResult UploadDriver::failure(TaskError error, std::string message) const {
  UploadResult result;
  result.status = UploadResult::Status::Failure;
  result.error = error;
  result.message = std::move(message);
  return result;
}

UploadResult UploadDriver::run(Task& task,
                               const std::filesystem::path& file,
                               const CancellationToken& token,
                               const ProgressCallback& on_progress) {
  if(token.cancelled()) return cancelled_result(task);
  if(!credentials_ || !storage_) {
    return failure(TaskError::TransferFailure, "no storage service configured");
  }

  std::optional<Credential> credential;
  try {
    credential = credentials_->get_credential();
  } catch(const std::exception& e) {
    logger_->error("Credential lookup failed for task {}: {}", task.id(), e.what());
  }
  if(!credential) {
    logger_->error("No usable storage credential for task {}", task.id());
    return failure(TaskError::AuthFailure, "auth");
  }

  UploadMetadata metadata;
  metadata.name = task.remote_name();
  metadata.container_id = options_.container_id;

  logger_->info("Starting upload of '{}' (task {})", metadata.name, task.id());

  std::unique_ptr<UploadSession> session;
  try {
    session = storage_->create_upload_session(*credential, metadata, file);
  } catch(const std::exception& e) {
    logger_->error("Upload session for task {} failed: {}", task.id(), e.what());
    return failure(TaskError::TransferFailure, e.what());
  }

  const uint64_t total = session->total_bytes();
  uint64_t previous_done = 0;
  auto previous_time = now();
  if(on_progress) on_progress(parse_upload_status(0, total, 0, 0.0), false);

  for(;;) {
    if(token.cancelled()) return cancelled_result(task);

    ChunkStatus status;
    try {
      status = session->next_chunk();
    } catch(const std::exception& e) {
      logger_->error("Error during upload for task {}: {}", task.id(), e.what());
      return failure(TaskError::TransferFailure, e.what());
    }

    const auto current_time = now();
    const double elapsed = std::chrono::duration<double>(current_time - previous_time).count();
    const uint64_t done = status.complete ? total : status.bytes_done;
    auto snapshot = parse_upload_status(done, total, previous_done, elapsed);
    if(status.complete) {
      snapshot.percent = 100;
      if(on_progress) on_progress(snapshot, true);

      UploadResult result;
      result.status = UploadResult::Status::Success;
      result.remote_id = status.remote_id;
      result.view_link = status.view_link;
      logger_->info("Upload complete for task {}: id {}", task.id(), result.remote_id);
      return result;
    }
    if(on_progress) on_progress(snapshot, false);
    previous_done = done;
    previous_time = current_time;
  }
}
