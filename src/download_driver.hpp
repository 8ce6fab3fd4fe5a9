#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "progress_parser.hpp"
#include "task.hpp"
#include "task_registry.hpp"

struct DownloadResult {
  enum class Status { Success, Failure, Cancelled };

  Status status = Status::Failure;
  TaskError error = TaskError::None;
  std::filesystem::path file_path;
  std::string message;
  int exit_code = -1;
};

// Runs the external retriever for one task and supervises it until it exits
// or the task leaves the registry.
class DownloadDriver {
public:
  struct Options {
    std::string retriever = "yt-dlp";
    std::vector<std::string> headers{
      "Origin: https://www.mediasetinfinity.es",
      "Referer: https://www.mediasetinfinity.es"
    };
    std::string remux_format = "mp4";
    std::chrono::milliseconds poll_interval{250};
    std::chrono::milliseconds terminate_grace{2000};
  };

  // final is set once per successful phase, for the last snapshot seen.
  using ProgressCallback = std::function<void(const ProgressSnapshot& snapshot, bool final)>;

  DownloadDriver(Options options,
                 std::shared_ptr<TaskRegistry> registry,
                 std::shared_ptr<Logger> logger = nullptr);

  // Streaming-manifest (.../mpd-cenc.ism/web.mpd) URLs become their HLS playlist.
  static std::string rewrite_source_url(const std::string& url);

  std::vector<std::string> build_arguments(const Task& task) const;
  std::vector<std::string> build_title_arguments(const std::string& url) const;

  DownloadResult run(Task& task,
                     const CancellationToken& token,
                     const ProgressCallback& on_progress);

  bool fetch_title(const std::string& url, std::string& title, std::string& error);

  const Options& options() const { return options_; }

private:
  DownloadResult cancelled_result(Task& task) const;

  Options options_;
  std::shared_ptr<TaskRegistry> registry_;
  std::shared_ptr<Logger> logger_;
};

const char* to_string(DownloadResult::Status status);
