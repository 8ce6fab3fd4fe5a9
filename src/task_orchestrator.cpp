#include "task_orchestrator.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>

#include "utils.hpp"

namespace {

constexpr std::size_t kMaxFailureText = 1000;

std::string quality_label(const std::string& choice) {
  if(choice == "best") return "Best quality";
  return choice + "p";
}

} // namespace

// Runs the finalize step exactly once for a task on every exit path of execute().
class TaskOrchestrator::FinalizeGuard {
public:
  FinalizeGuard(TaskOrchestrator& owner, const Task& task) : owner_(owner), task_(task) {}
  ~FinalizeGuard() { owner_.finalize_task(task_); }

  FinalizeGuard(const FinalizeGuard&) = delete;
  FinalizeGuard& operator=(const FinalizeGuard&) = delete;

private:
  TaskOrchestrator& owner_;
  const Task& task_;
};

TaskOrchestrator::TaskOrchestrator(Options options,
                                   std::shared_ptr<TaskRegistry> registry,
                                   std::shared_ptr<DownloadDriver> download,
                                   std::shared_ptr<UploadDriver> upload,
                                   std::shared_ptr<RateLimitedNotifier> notifier,
                                   std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    registry_(std::move(registry)),
    download_(std::move(download)),
    upload_(std::move(upload)),
    notifier_(std::move(notifier)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("orchestrator")),
    pool_(std::max<std::size_t>(1, options_.max_parallel_tasks)) {
  if(!registry_ || !download_ || !upload_ || !notifier_) {
    throw std::invalid_argument("TaskOrchestrator requires a registry, both drivers and a notifier");
  }
  if(options_.history_limit == 0) options_.history_limit = 64;
}

TaskOrchestrator::~TaskOrchestrator() {
  pool_.join();
}

bool TaskOrchestrator::validate_url(const std::string& url, std::string& error) {
  static const std::regex scheme(R"(^https?://\S+$)", std::regex::icase);
  if(!std::regex_match(url, scheme)) {
    error = "Invalid URL: '" + url + "'";
    return false;
  }
  return true;
}

PrepareResult TaskOrchestrator::prepare(const std::string& url,
                                        const std::string& display_name,
                                        const MessageTarget& target) {
  PrepareResult result;
  const std::string trimmed_url = trim_copy(url);
  notifier_->open(target);

  if(!validate_url(trimmed_url, result.message)) {
    result.error = TaskError::InvalidInput;
    notifier_->post(target, result.message);
    notifier_->forget(target);
    return result;
  }

  std::string name = trim_copy(display_name);
  if(name.empty()) {
    notifier_->post(target, "Fetching video title...");
    std::string error;
    if(!download_->fetch_title(trimmed_url, name, error)) {
      result.error = TaskError::RetrievalFailure;
      result.message = "Could not fetch the title.\n" + truncate_for_display(error, kMaxFailureText);
      logger_->warn("Title lookup failed for {}: {}", trimmed_url, error);
      notifier_->post(target, result.message);
      notifier_->forget(target);
      return result;
    }
  }
  name = sanitize_file_name(name);
  if(name.empty()) name = "media";

  PendingJob job;
  job.id = make_uuid_v4();
  job.source_url = trimmed_url;
  job.display_name = name;
  job.target = target;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_[job.id] = job;
  }

  std::vector<MessageAction> actions;
  for(const auto& choice : quality_choices()) {
    actions.push_back({quality_label(choice), "quality_" + choice + "_" + job.id, std::string()});
  }
  notifier_->post(target, name + "\n\nChoose the download quality:", actions);
  logger_->info("Prepared job {} for '{}'", job.id, name);

  result.ok = true;
  result.job_id = job.id;
  result.display_name = name;
  return result;
}

SubmitResult TaskOrchestrator::select_quality(const std::string& job_id, const std::string& choice) {
  SubmitResult result;

  std::string selector;
  if(!quality_selector_for(choice, selector, result.message)) {
    result.error = TaskError::InvalidInput;
    return result;
  }

  PendingJob job;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(job_id);
    if(it == pending_.end()) {
      result.error = TaskError::InvalidInput;
      result.message = "This selection has expired. Start a new download.";
      return result;
    }
    job = std::move(it->second);
    pending_.erase(it);
  }

  const auto& remux = download_->options().remux_format;
  auto output = options_.work_dir / (job.display_name + "-" + job.id.substr(0, 8) + "." + remux);
  auto task = std::make_shared<Task>(job.id,
                                     job.source_url,
                                     job.display_name,
                                     selector,
                                     job.target,
                                     output,
                                     job.display_name + "." + remux);

  if(!registry_->register_task(task, result.message)) {
    result.error = TaskError::InvalidInput;
    return result;
  }

  notifier_->open(task->target());
  notifier_->post(task->target(), "Starting download: " + task->display_name(), cancel_actions(*task));
  logger_->info("Task {} created for '{}' with selector {}", task->id(), task->display_name(), selector);

  {
    std::lock_guard<std::mutex> lock(units_mutex_);
    ++running_units_;
  }
  asio::post(pool_, [this, task]{ run_unit(task); });

  result.ok = true;
  result.task_id = task->id();
  return result;
}

void TaskOrchestrator::run_unit(std::shared_ptr<Task> task) {
  TaskOutcome outcome = execute(task);
  record(outcome);

  CompletionCallback callback;
  {
    std::lock_guard<std::mutex> lock(history_mutex_);
    callback = completion_;
  }
  if(callback) {
    try {
      callback(outcome);
    } catch(const std::exception& e) {
      logger_->error("Completion callback for task {} threw: {}", outcome.task_id, e.what());
    }
  }

  {
    std::lock_guard<std::mutex> lock(units_mutex_);
    --running_units_;
  }
  units_cv_.notify_all();
}

TaskOutcome TaskOrchestrator::execute(const std::shared_ptr<Task>& task) {
  FinalizeGuard guard(*this, *task);
  const auto& target = task->target();
  const auto& name = task->display_name();
  CancellationToken token(registry_, task->id());

  try {
    if(token.cancelled()) {
      task->set_state(TaskState::Cancelled);
      logger_->info("Task {} cancelled before it started", task->id());
      return make_outcome(*task, TaskState::Cancelled, TaskError::Cancelled, "cancelled");
    }

    const auto actions = cancel_actions(*task);
    auto forward = [&](const ProgressSnapshot& snapshot, bool final) {
      notifier_->notify(target, name, snapshot, actions, final);
    };

    task->set_state(TaskState::Downloading);
    auto downloaded = download_->run(*task, token, forward);
    if(downloaded.status == DownloadResult::Status::Cancelled || token.cancelled()) {
      task->set_state(TaskState::Cancelled);
      return make_outcome(*task, TaskState::Cancelled, TaskError::Cancelled, "cancelled");
    }
    if(downloaded.status == DownloadResult::Status::Failure) {
      task->set_state(TaskState::Failed);
      auto text = "Download failed: " + name + "\n" + truncate_for_display(downloaded.message, kMaxFailureText);
      notifier_->post_final(target, text);
      return make_outcome(*task, TaskState::Failed, downloaded.error, downloaded.message);
    }

    task->set_state(TaskState::Uploading);
    notifier_->post(target, "Download complete: " + name + "\n\nPreparing upload...", actions);

    auto uploaded = upload_->run(*task, downloaded.file_path, token, forward);
    if(uploaded.status == UploadResult::Status::Cancelled || token.cancelled()) {
      task->set_state(TaskState::Cancelled);
      return make_outcome(*task, TaskState::Cancelled, TaskError::Cancelled, "cancelled");
    }
    if(uploaded.status == UploadResult::Status::Failure) {
      task->set_state(TaskState::Failed);
      std::string text = (uploaded.error == TaskError::AuthFailure)
        ? "Upload failed: " + name + "\nNo usable storage credential, authenticate and try again."
        : "Error uploading to storage: " + name + "\n" + truncate_for_display(uploaded.message, kMaxFailureText);
      notifier_->post_final(target, text);
      return make_outcome(*task, TaskState::Failed, uploaded.error, uploaded.message);
    }

    task->set_state(TaskState::Completed);
    auto outcome = make_outcome(*task, TaskState::Completed, TaskError::None, "completed");
    outcome.remote_id = uploaded.remote_id;
    outcome.view_link = uploaded.view_link;
    notifier_->post_final(target, "Completed!\n\nTitle: " + name,
                          link_actions(uploaded.remote_id, uploaded.view_link));
    return outcome;
  } catch(const std::exception& e) {
    logger_->error("Unexpected error in task {}: {}", task->id(), e.what());
    if(token.cancelled()) {
      task->set_state(TaskState::Cancelled);
      return make_outcome(*task, TaskState::Cancelled, TaskError::Cancelled, "cancelled");
    }
    task->set_state(TaskState::Failed);
    notifier_->post_final(target, "Unexpected error for " + name + ":\n" +
                                  truncate_for_display(e.what(), kMaxFailureText));
    return make_outcome(*task, TaskState::Failed, TaskError::TransferFailure, e.what());
  }
}

void TaskOrchestrator::finalize_task(const Task& task) {
  if(registry_->finalize(task.id())) {
    logger_->debug("Task {} removed from registry", task.id());
  }
  remove_artifacts(task, logger_.get());
  notifier_->forget(task.target());
}

bool TaskOrchestrator::finalize(const std::string& task_id) {
  auto task = registry_->finalize(task_id);
  if(!task) return false;
  remove_artifacts(*task, logger_.get());
  notifier_->forget(task->target());
  return true;
}

CancelResult TaskOrchestrator::cancel(const std::string& task_id) {
  auto result = registry_->cancel(task_id);
  if(!result.found) {
    logger_->warn("Cancel requested for unknown task {}", task_id);
    return result;
  }
  notifier_->post_final(result.task->target(), "Download cancelled: " + result.task->display_name());
  return result;
}

std::size_t TaskOrchestrator::cancel_all() {
  std::size_t cancelled = 0;
  for(const auto& id : registry_->ids()) {
    if(cancel(id).found) ++cancelled;
  }
  return cancelled;
}

void TaskOrchestrator::wait_idle() {
  std::unique_lock<std::mutex> lock(units_mutex_);
  units_cv_.wait(lock, [this]{ return running_units_ == 0; });
}

bool TaskOrchestrator::wait_idle_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(units_mutex_);
  return units_cv_.wait_for(lock, timeout, [this]{ return running_units_ == 0; });
}

std::size_t TaskOrchestrator::running_units() const {
  std::lock_guard<std::mutex> lock(units_mutex_);
  return running_units_;
}

std::vector<TaskSummary> TaskOrchestrator::active_tasks() const {
  return registry_->snapshot();
}

std::vector<PendingJob> TaskOrchestrator::pending_jobs() const {
  std::vector<PendingJob> out;
  std::lock_guard<std::mutex> lock(pending_mutex_);
  for(const auto& entry : pending_) out.push_back(entry.second);
  return out;
}

std::vector<TaskOutcome> TaskOrchestrator::history() const {
  std::lock_guard<std::mutex> lock(history_mutex_);
  return std::vector<TaskOutcome>(history_.begin(), history_.end());
}

std::optional<TaskOutcome> TaskOrchestrator::outcome(const std::string& task_id) const {
  std::lock_guard<std::mutex> lock(history_mutex_);
  for(auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if(it->task_id == task_id) return *it;
  }
  return std::nullopt;
}

void TaskOrchestrator::set_completion_callback(CompletionCallback callback) {
  std::lock_guard<std::mutex> lock(history_mutex_);
  completion_ = std::move(callback);
}

void TaskOrchestrator::record(const TaskOutcome& outcome) {
  logger_->info("Task {} finished: {}{}", outcome.task_id, to_string(outcome.state),
                outcome.error == TaskError::None ? std::string()
                                                 : std::string(" (") + to_string(outcome.error) + ")");
  std::lock_guard<std::mutex> lock(history_mutex_);
  history_.push_back(outcome);
  while(history_.size() > options_.history_limit) history_.pop_front();
}

TaskOutcome TaskOrchestrator::make_outcome(const Task& task,
                                           TaskState state,
                                           TaskError error,
                                           std::string message) const {
  TaskOutcome outcome;
  outcome.task_id = task.id();
  outcome.display_name = task.display_name();
  outcome.state = state;
  outcome.error = error;
  outcome.message = std::move(message);
  outcome.finished_at = std::chrono::system_clock::now();
  return outcome;
}

std::vector<MessageAction> TaskOrchestrator::cancel_actions(const Task& task) const {
  std::vector<MessageAction> actions;
  actions.push_back({"Cancel", "cancel_" + task.id(), std::string()});
  return actions;
}

std::vector<MessageAction> TaskOrchestrator::link_actions(const std::string& remote_id,
                                                          const std::string& view_link) const {
  std::vector<MessageAction> actions;
  if(!view_link.empty()) {
    actions.push_back({"View file", std::string(), view_link});
  }
  if(!options_.mirror_link_template.empty() && !remote_id.empty()) {
    std::string mirror = options_.mirror_link_template;
    const std::string placeholder = "{id}";
    for(auto pos = mirror.find(placeholder); pos != std::string::npos;
        pos = mirror.find(placeholder, pos + remote_id.size())) {
      mirror.replace(pos, placeholder.size(), remote_id);
    }
    actions.push_back({"Mirror link", std::string(), mirror});
  }
  return actions;
}
