#include "task_registry.hpp"

#include <algorithm>

#include "child_process.hpp"

CancellationToken::CancellationToken(std::shared_ptr<const TaskRegistry> registry, std::string task_id)
  : registry_(std::move(registry)), task_id_(std::move(task_id)) {}

bool CancellationToken::cancelled() const {
  if(!registry_) return false;
  return !registry_->contains(task_id_);
}

TaskRegistry::TaskRegistry(std::chrono::milliseconds terminate_grace, std::shared_ptr<Logger> logger)
  : terminate_grace_(terminate_grace),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("registry")) {}

bool TaskRegistry::register_task(std::shared_ptr<Task> task, std::string& error) {
  if(!task) {
    error = "null task";
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto inserted = entries_.emplace(task->id(), Entry{task, nullptr});
  if(!inserted.second) {
    error = "task " + task->id() + " is already registered";
    return false;
  }
  return true;
}

bool TaskRegistry::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(id) != 0;
}

std::shared_ptr<Task> TaskRegistry::find(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : it->second.task;
}

bool TaskRegistry::attach_process(const std::string& id, std::shared_ptr<ChildProcess> process) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if(it == entries_.end()) return false;
  it->second.process = std::move(process);
  return true;
}

void TaskRegistry::detach_process(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if(it != entries_.end()) it->second.process.reset();
}

CancelResult TaskRegistry::cancel(const std::string& id) {
  CancelResult result;
  std::shared_ptr<ChildProcess> process;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if(it == entries_.end()) return result;
    result.found = true;
    result.task = std::move(it->second.task);
    process = std::move(it->second.process);
    entries_.erase(it);
  }

  result.task->set_state(TaskState::Cancelled);
  if(process) {
    process->terminate_tree(terminate_grace_);
    result.process_terminated = true;
    logger_->info("Process {} for task {} terminated", process->pid(), id);
  }
  result.artifacts_removed = remove_artifacts(*result.task, logger_.get());
  logger_->info("Task {} cancelled", id);
  return result;
}

std::shared_ptr<Task> TaskRegistry::finalize(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if(it == entries_.end()) return nullptr;
  auto task = std::move(it->second.task);
  entries_.erase(it);
  return task;
}

std::vector<TaskSummary> TaskRegistry::snapshot() const {
  std::vector<TaskSummary> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(entries_.size());
    for(const auto& entry : entries_) {
      TaskSummary summary;
      summary.id = entry.first;
      summary.display_name = entry.second.task->display_name();
      summary.state = entry.second.task->state();
      summary.has_process = static_cast<bool>(entry.second.process);
      out.push_back(std::move(summary));
    }
  }
  std::sort(out.begin(), out.end(),
            [](const TaskSummary& a, const TaskSummary& b){ return a.id < b.id; });
  return out;
}

std::vector<std::string> TaskRegistry::ids() const {
  std::vector<std::string> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(entries_.size());
  for(const auto& entry : entries_) out.push_back(entry.first);
  return out;
}

std::size_t TaskRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::optional<std::string> TaskRegistry::resolve(const std::string& id_or_prefix, std::string& error) const {
  if(id_or_prefix.empty()) {
    error = "empty task id";
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if(entries_.count(id_or_prefix)) return id_or_prefix;

  std::optional<std::string> match;
  for(const auto& entry : entries_) {
    if(entry.first.compare(0, id_or_prefix.size(), id_or_prefix) != 0) continue;
    if(match) {
      error = "task id prefix '" + id_or_prefix + "' is ambiguous";
      return std::nullopt;
    }
    match = entry.first;
  }
  if(!match) error = "no active task matches '" + id_or_prefix + "'";
  return match;
}
