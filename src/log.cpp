#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <vector>

namespace {
constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kBarePattern = "%v";

// Three console loggers: stamped diagnostics on stdout, stamped errors on
// stderr, bare command replies on stdout. Bare errors share stderr's sink.
struct ProcessSinks {
  std::mutex mutex;
  std::shared_ptr<spdlog::logger> diagnostics;
  std::shared_ptr<spdlog::logger> errors;
  std::shared_ptr<spdlog::logger> replies;
  std::shared_ptr<spdlog::logger> reply_errors;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
  std::string file_path;

  std::array<spdlog::logger*, 4> all() const {
    return {diagnostics.get(), errors.get(), replies.get(), reply_errors.get()};
  }
};

ProcessSinks& sinks() {
  static ProcessSinks instance;
  return instance;
}

std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name,
                                                    spdlog::sink_ptr sink,
                                                    const char* pattern,
                                                    spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

void ensure_created(ProcessSinks& s) {
  if(s.diagnostics) return;
  s.diagnostics = make_console_logger("relay",
    std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), kStampedPattern, spdlog::level::warn);
  s.errors = make_console_logger("relay.err",
    std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), kStampedPattern, spdlog::level::err);
  s.replies = make_console_logger("relay.out",
    std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), kBarePattern, spdlog::level::info);
  s.reply_errors = make_console_logger("relay.out.err",
    std::make_shared<spdlog::sinks::stderr_color_sink_mt>(), kBarePattern, spdlog::level::err);
}

void swap_file_sink(ProcessSinks& s, const std::string& path) {
  if(path.empty() || path == s.file_path) return;
  auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
  file->set_pattern(kStampedPattern);
  for(auto* logger : s.all()) {
    auto& attached = logger->sinks();
    attached.erase(std::remove(attached.begin(), attached.end(), s.file), attached.end());
    attached.push_back(file);
  }
  s.file = std::move(file);
  s.file_path = path;
}

spdlog::logger* route(ProcessSinks& s, LogChannel channel) {
  switch(channel) {
    case LogChannel::Error: return s.errors.get();
    case LogChannel::Print: return s.replies.get();
    case LogChannel::PrintErr: return s.reply_errors.get();
    default: return s.diagnostics.get();
  }
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    default: return spdlog::level::info;
  }
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose, const std::string& log_file) {
  auto& s = sinks();
  std::lock_guard<std::mutex> lock(s.mutex);
  ensure_created(s);
  if(!log_file.empty()) {
    try {
      swap_file_sink(s, log_file);
    } catch(const spdlog::spdlog_ex& e) {
      s.errors->error("Unable to open log file {}: {}", log_file, e.what());
    }
  }

  const auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.diagnostics->set_level(level);
  for(auto* logger : {s.errors.get(), s.replies.get(), s.reply_errors.get()}) {
    logger->set_level(spdlog::level::info);
  }
  spdlog::set_default_logger(s.diagnostics);
  spdlog::set_level(level);
}

void write_to_sinks(const LogRecord& record) {
  if(!log_passthrough()) return;

  auto& s = sinks();
  spdlog::logger* target = nullptr;
  {
    std::lock_guard<std::mutex> lock(s.mutex);
    ensure_created(s);
    target = route(s, record.channel);
  }
  const char* bare = channel_name(record.channel);
  if(record.source.empty() || record.source == bare) {
    target->log(channel_level(record.channel), record.message);
  } else {
    target->log(channel_level(record.channel), fmt::format("[{}] {}", record.source, record.message));
  }
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  const auto handle = next_handle_.fetch_add(1);
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::write(LogChannel channel, std::string message) {
  LogRecord record;
  record.channel = channel;
  record.source = name_.empty() ? std::string(channel_name(channel))
                                : name_ + ":" + channel_name(channel);
  record.message = std::move(message);
  if(notify_listeners(record)) return;
  write_to_sinks(record);
}

bool Logger::notify_listeners(const LogRecord& record) {
  std::vector<Listener> current;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for(const auto& entry : listeners_) current.push_back(entry.second);
  }
  bool consumed = false;
  for(auto& listener : current) {
    try {
      consumed = listener(record) || consumed;
    } catch(const std::exception& e) {
      write_to_sinks(LogRecord{LogChannel::Error, "logger",
                               fmt::format("log listener threw: {}", e.what())});
    }
  }
  return consumed;
}
