#include "download_driver.hpp"

#include <asio.hpp>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <regex>
#include <system_error>
#include <thread>

#include "child_process.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kStderrKeep = 4096;

class PipeReader {
public:
  using DataHandler = std::function<void(const char*, std::size_t)>;

  PipeReader(asio::io_context& io, int fd, DataHandler on_data)
    : stream_(io), on_data_(std::move(on_data)) {
    if(fd < 0) {
      finished_ = true;
      return;
    }
    stream_.assign(fd);
  }

  void start() {
    if(!finished_) read_next();
  }

  bool finished() const { return finished_; }

private:
  void read_next() {
    stream_.async_read_some(asio::buffer(buffer_),
      [this](const std::error_code& ec, std::size_t bytes) {
        if(bytes > 0 && on_data_) on_data_(buffer_.data(), bytes);
        if(ec) {
          finished_ = true;
          return;
        }
        read_next();
      });
  }

  asio::posix::stream_descriptor stream_;
  DataHandler on_data_;
  std::array<char, 4096> buffer_{};
  bool finished_ = false;
};

// Drains both pipes, one bounded read cycle at a time. Returns false if
// should_stop fired before the pipes closed.
bool pump_output(ChildProcess& process,
                 std::chrono::milliseconds poll_interval,
                 const PipeReader::DataHandler& on_stdout,
                 const PipeReader::DataHandler& on_stderr,
                 const std::function<bool()>& should_stop) {
  asio::io_context io;
  PipeReader out(io, process.release_stdout(), on_stdout);
  PipeReader err(io, process.release_stderr(), on_stderr);
  out.start();
  err.start();

  while(!out.finished() || !err.finished()) {
    if(should_stop && should_stop()) return false;
    io.restart();
    io.run_for(poll_interval);
  }
  return true;
}

void append_bounded(std::string& sink, const char* data, std::size_t size) {
  sink.append(data, size);
  if(sink.size() > kStderrKeep) {
    sink.erase(0, sink.size() - kStderrKeep);
  }
}

} // namespace

const char* to_string(DownloadResult::Status status) {
  switch(status) {
    case DownloadResult::Status::Success: return "success";
    case DownloadResult::Status::Failure: return "failure";
    case DownloadResult::Status::Cancelled: return "cancelled";
  }
  return "unknown";
}

DownloadDriver::DownloadDriver(Options options,
                               std::shared_ptr<TaskRegistry> registry,
                               std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    registry_(std::move(registry)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("download")) {
  if(options_.poll_interval.count() <= 0) options_.poll_interval = std::chrono::milliseconds(250);
  if(options_.remux_format.empty()) options_.remux_format = "mp4";
}

std::string DownloadDriver::rewrite_source_url(const std::string& url) {
  static const std::regex manifest(R"((/mpd-cenc\.ism)/(web|ctv)?(\.mpd))");
  if(!std::regex_search(url, manifest)) return url;
  return std::regex_replace(url, manifest, "/main.ism/picky.m3u8");
}

std::vector<std::string> DownloadDriver::build_arguments(const Task& task) const {
  std::vector<std::string> args{
    options_.retriever,
    "-f", task.quality_selector(),
    "--remux-video", options_.remux_format
  };
  for(const auto& header : options_.headers) {
    args.push_back("--add-header");
    args.push_back(header);
  }
  args.push_back("-o");
  args.push_back(task.output_path().string());
  args.push_back(rewrite_source_url(task.source_url()));
  return args;
}

std::vector<std::string> DownloadDriver::build_title_arguments(const std::string& url) const {
  std::vector<std::string> args{options_.retriever, "--get-title", "--no-warnings"};
  for(const auto& header : options_.headers) {
    args.push_back("--add-header");
    args.push_back(header);
  }
  args.push_back(rewrite_source_url(url));
  return args;
}

DownloadResult DownloadDriver::cancelled_result(Task& task) const {
  task.set_state(TaskState::Cancelled);
  DownloadResult result;
  result.status = DownloadResult::Status::Cancelled;
  result.error = TaskError::Cancelled;
  result.message = "cancelled";
  logger_->info("Task {} cancelled during download", task.id());
  return result;
}

DownloadResult DownloadDriver::run(Task& task,
                                   const CancellationToken& token,
                                   const ProgressCallback& on_progress) {
  DownloadResult result;
  result.error = TaskError::RetrievalFailure;

  if(token.cancelled()) return cancelled_result(task);

  std::error_code ec;
  if(task.output_path().has_parent_path()) {
    std::filesystem::create_directories(task.output_path().parent_path(), ec);
  }

  const auto args = build_arguments(task);
  if(task.source_url() != args.back()) {
    logger_->info("Manifest URL detected for task {}, using HLS playlist {}", task.id(), args.back());
  }
  logger_->info("Starting retriever for task {}: {}", task.id(), fmt::join(args, " "));

  std::string spawn_error;
  std::shared_ptr<ChildProcess> process;
  try {
    process = ChildProcess::spawn(args, spawn_error);
  } catch(const std::system_error& e) {
    spawn_error = e.what();
  }
  if(!process) {
    result.message = spawn_error;
    logger_->error("Task {}: {}", task.id(), spawn_error);
    return result;
  }

  if(!registry_->attach_process(task.id(), process)) {
    process->terminate_tree(options_.terminate_grace);
    return cancelled_result(task);
  }

  ProgressFrameBuffer stdout_frames;
  ProgressFrameBuffer stderr_frames;
  std::string stderr_text;
  std::optional<ProgressSnapshot> last;

  auto consume = [&](const std::vector<std::string>& frames) {
    for(const auto& frame : frames) {
      auto snapshot = parse_download_line(frame);
      if(!snapshot) continue;
      if(last && snapshot->percent <= last->percent) continue;
      last = snapshot;
      if(on_progress) on_progress(*snapshot, false);
    }
  };

  auto stop = [&]{ return token.cancelled(); };
  bool drained = pump_output(*process, options_.poll_interval,
    [&](const char* data, std::size_t size) {
      consume(stdout_frames.push(data, size));
    },
    [&](const char* data, std::size_t size) {
      append_bounded(stderr_text, data, size);
      consume(stderr_frames.push(data, size));
    },
    stop);

  if(!drained) {
    process->terminate_tree(options_.terminate_grace);
    registry_->detach_process(task.id());
    return cancelled_result(task);
  }

  consume({stdout_frames.take_remainder(), stderr_frames.take_remainder()});

  std::optional<int> exit_code;
  const auto wait_step = std::min(options_.poll_interval, std::chrono::milliseconds(50));
  while(!(exit_code = process->try_wait())) {
    if(token.cancelled()) {
      process->terminate_tree(options_.terminate_grace);
      registry_->detach_process(task.id());
      return cancelled_result(task);
    }
    std::this_thread::sleep_for(wait_step);
  }
  registry_->detach_process(task.id());

  if(token.cancelled()) return cancelled_result(task);

  result.exit_code = *exit_code;
  const bool produced = std::filesystem::exists(task.output_path(), ec);
  if(*exit_code == 0 && produced) {
    if(last && on_progress) on_progress(*last, true);
    result.status = DownloadResult::Status::Success;
    result.error = TaskError::None;
    result.file_path = task.output_path();
    logger_->info("Task {} download complete: {}", task.id(), result.file_path.string());
    return result;
  }

  result.message = tail_for_display(stderr_text, 1000);
  if(result.message.empty()) {
    result.message = (*exit_code == 0)
      ? "retriever finished without producing " + task.output_path().filename().string()
      : fmt::format("retriever exited with code {}", *exit_code);
  }
  logger_->error("Task {} download failed (exit {}): {}", task.id(), *exit_code, result.message);
  return result;
}

bool DownloadDriver::fetch_title(const std::string& url, std::string& title, std::string& error) {
  const auto args = build_title_arguments(url);
  logger_->debug("Resolving title: {}", fmt::join(args, " "));

  std::shared_ptr<ChildProcess> process;
  try {
    process = ChildProcess::spawn(args, error);
  } catch(const std::system_error& e) {
    error = e.what();
  }
  if(!process) return false;

  std::string out_text;
  std::string err_text;
  pump_output(*process, options_.poll_interval,
    [&](const char* data, std::size_t size) { out_text.append(data, size); },
    [&](const char* data, std::size_t size) { append_bounded(err_text, data, size); },
    nullptr);

  std::optional<int> exit_code;
  while(!(exit_code = process->try_wait())) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  if(*exit_code != 0) {
    error = tail_for_display(err_text, 1000);
    if(error.empty()) error = fmt::format("retriever exited with code {}", *exit_code);
    return false;
  }

  const auto newline = out_text.find('\n');
  title = trim_copy(out_text.substr(0, newline));
  if(title.empty()) {
    error = "retriever returned an empty title";
    return false;
  }
  return true;
}
