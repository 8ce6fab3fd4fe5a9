#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

// Console output is split: diagnostics carry a timestamp, Print/PrintErr are
// the bare lines a console user reads as command replies.
enum class LogChannel {
  Debug,
  Info,
  Warn,
  Error,
  Print,
  PrintErr,
};

const char* channel_name(LogChannel channel);
spdlog::level::level_enum channel_level(LogChannel channel);

// Sets up the process-wide sinks. log_file may be empty.
void init(bool verbose = false, const std::string& log_file = std::string());

// When disabled, records reach listeners only. Test runners use this to keep
// their output readable.
void set_log_passthrough(bool enabled);
bool log_passthrough();

struct LogRecord {
  LogChannel channel = LogChannel::Info;
  std::string source;   // "<logger name>:<channel>" or just the channel
  std::string message;
};

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Returning true marks the record consumed; it is then not written to the sinks.
  using Listener = std::function<bool(const LogRecord&)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void write(LogChannel channel, std::string message);

private:
  bool notify_listeners(const LogRecord& record);

  std::string name_;
  std::mutex listener_mutex_;
  std::map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_handle_{1};
};

// Writes straight to the process sinks, bypassing any listener.
void write_to_sinks(const LogRecord& record);

// Free helpers for code that may run without a Logger (settings loading,
// argument parsing). A null logger goes to the process sinks.
template<typename... Args>
inline void log_to(Logger* logger, LogChannel channel,
                   spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->write(channel, std::move(message));
    return;
  }
  write_to_sinks(LogRecord{channel, channel_name(channel), std::move(message)});
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
