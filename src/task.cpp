#include "task.hpp"

#include <algorithm>
#include <cctype>

#include "log.hpp"

const char* to_string(TaskState state) {
  switch(state) {
    case TaskState::Created: return "created";
    case TaskState::Downloading: return "downloading";
    case TaskState::Uploading: return "uploading";
    case TaskState::Completed: return "completed";
    case TaskState::Failed: return "failed";
    case TaskState::Cancelled: return "cancelled";
  }
  return "unknown";
}

bool is_terminal(TaskState state) {
  return state == TaskState::Completed
      || state == TaskState::Failed
      || state == TaskState::Cancelled;
}

const char* to_string(TaskError error) {
  switch(error) {
    case TaskError::None: return "none";
    case TaskError::InvalidInput: return "invalid_input";
    case TaskError::AuthFailure: return "auth";
    case TaskError::RetrievalFailure: return "retrieval";
    case TaskError::TransferFailure: return "transfer";
    case TaskError::Cancelled: return "cancelled";
    case TaskError::NotifierFailure: return "notifier";
  }
  return "unknown";
}

const std::vector<std::string>& quality_choices() {
  static const std::vector<std::string> choices{"best", "1080", "720", "480"};
  return choices;
}

bool quality_selector_for(const std::string& choice, std::string& selector, std::string& error) {
  std::string normalized = choice;
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if(!normalized.empty() && normalized.back() == 'p') normalized.pop_back();

  const auto& choices = quality_choices();
  if(std::find(choices.begin(), choices.end(), normalized) == choices.end()) {
    error = "Unknown quality '" + choice + "' (expected best, 1080, 720 or 480)";
    return false;
  }
  if(normalized == "best") {
    selector = "bestvideo+bestaudio/best";
  } else {
    selector = "bestvideo[height<=" + normalized + "]+bestaudio/best[height<=" + normalized + "]";
  }
  return true;
}

Task::Task(std::string id,
           std::string source_url,
           std::string display_name,
           std::string quality_selector,
           MessageTarget target,
           std::filesystem::path output_path,
           std::string remote_name)
  : id_(std::move(id)),
    source_url_(std::move(source_url)),
    display_name_(std::move(display_name)),
    quality_selector_(std::move(quality_selector)),
    target_(std::move(target)),
    output_path_(std::move(output_path)),
    remote_name_(std::move(remote_name)) {}

std::vector<std::filesystem::path> Task::artifact_paths() const {
  std::vector<std::filesystem::path> paths;
  if(output_path_.empty()) return paths;
  paths.push_back(output_path_);
  paths.emplace_back(output_path_.string() + ".part");
  paths.emplace_back(output_path_.string() + ".ytdl");
  return paths;
}

std::size_t remove_artifacts(const Task& task, Logger* logger) {
  std::size_t removed = 0;
  for(const auto& path : task.artifact_paths()) {
    std::error_code ec;
    if(std::filesystem::remove(path, ec)) {
      ++removed;
      log_info(logger, "Removed temporary file '{}' for task {}", path.string(), task.id());
    } else if(ec) {
      log_warn(logger, "Could not remove '{}' for task {}: {}", path.string(), task.id(), ec.message());
    }
  }
  return removed;
}
