#pragma once
#include <atomic>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include "console_sink.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "task_orchestrator.hpp"
#include "utils.hpp"

class RelayCLI {
public:
  RelayCLI(std::shared_ptr<TaskOrchestrator> orchestrator,
           std::shared_ptr<SettingsManager> settings,
           std::shared_ptr<ConsoleSink> sink,
           std::ostream& out = std::cout)
    : orchestrator_(std::move(orchestrator)),
      settings_(std::move(settings)),
      sink_(std::move(sink)),
      out_(out),
      running_(true) {}

  ~RelayCLI() {
    stop();
  }

  void set_quit_callback(std::function<void()> callback) {
    on_quit_ = std::move(callback);
  }

  void start() {
    running_ = true;
    cli_thread_ = std::thread([this](){ run_loop(); });
  }

  void stop() {
    running_ = false;
    if(cli_thread_.joinable()) cli_thread_.join();
  }

  // Returns false once the operator asked to quit.
  bool execute(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return true;

    std::string args;
    std::getline(iss, args);
    args = trim_copy(args);

    if(cmd == "start" || cmd == "startmedia") {
      start_command(args);
    } else if(cmd == "quality" || cmd == "q") {
      quality_command(args);
    } else if(cmd == "cancel" || cmd == "c") {
      cancel_command(args);
    } else if(cmd == "tasks" || cmd == "t") {
      list_tasks();
    } else if(cmd == "history") {
      list_history();
    } else if(cmd == "settings" || cmd == "s") {
      handle_settings_command(args.empty() ? "list" : args);
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit") {
      out_ << "Quitting...\n";
      return false;
    } else {
      print_help();
      out_ << "Unknown command: " << cmd << "\n";
    }
    return true;
  }

private:
  void run_loop() {
    while(running_) {
      auto input = read_command_line("> ");
      if(!input) break;
      if(!execute(*input)) break;
    }
    running_ = false;
    if(on_quit_) on_quit_();
  }

  // Polls stdin so that stop() is honoured while no input is pending.
  std::optional<std::string> read_command_line(const char* prompt) {
    out_ << prompt;
    out_.flush();
    for(;;) {
      auto newline = input_buffer_.find('\n');
      if(newline != std::string::npos) {
        std::string line = input_buffer_.substr(0, newline);
        input_buffer_.erase(0, newline + 1);
        if(!line.empty() && line.back() == '\r') line.pop_back();
        return line;
      }
      if(!running_) return std::nullopt;

      pollfd pfd{STDIN_FILENO, POLLIN, 0};
      int ready = ::poll(&pfd, 1, 200);
      if(ready < 0) {
        if(errno == EINTR) continue;
        return std::nullopt;
      }
      if(ready == 0) continue;

      char buffer[512];
      ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
      if(n < 0 && errno == EINTR) continue;
      if(n <= 0) {
        if(input_buffer_.empty()) return std::nullopt;
        std::string line;
        line.swap(input_buffer_);
        return line;
      }
      input_buffer_.append(buffer, static_cast<std::size_t>(n));
    }
  }

  void start_command(const std::string& args) {
    std::istringstream iss(args);
    std::string url;
    iss >> url;
    if(url.empty()) {
      out_ << "Usage: start <url> [name]\n";
      return;
    }
    std::string name;
    std::getline(iss, name);
    name = trim_copy(name);

    auto target = sink_->next_target();
    auto result = orchestrator_->prepare(url, name, target);
    if(!result.ok) return;
    out_ << "Job " << result.job_id.substr(0, 8) << " ready: quality "
         << result.job_id.substr(0, 8) << " <best|1080|720|480>\n";
  }

  std::optional<std::string> resolve_pending(const std::string& prefix) {
    std::optional<std::string> match;
    for(const auto& job : orchestrator_->pending_jobs()) {
      if(job.id.compare(0, prefix.size(), prefix) != 0) continue;
      if(match) return std::nullopt;
      match = job.id;
    }
    return match;
  }

  void quality_command(const std::string& args) {
    std::istringstream iss(args);
    std::string job;
    std::string choice;
    iss >> job >> choice;
    if(job.empty() || choice.empty()) {
      out_ << "Usage: quality <job> <best|1080|720|480>\n";
      return;
    }
    auto resolved = resolve_pending(job);
    auto result = orchestrator_->select_quality(resolved ? *resolved : job, choice);
    if(!result.ok) {
      out_ << result.message << "\n";
      return;
    }
    out_ << "Task " << result.task_id << " queued.\n";
  }

  void cancel_command(const std::string& args) {
    if(args.empty()) {
      out_ << "Usage: cancel <task>\n";
      return;
    }
    std::string error;
    auto resolved = orchestrator_->registry()->resolve(args, error);
    if(!resolved) {
      out_ << "No active task found.\n";
      return;
    }
    auto result = orchestrator_->cancel(*resolved);
    if(!result.found) {
      out_ << "No active task found.\n";
      return;
    }
    out_ << "Task " << *resolved << " cancelled.\n";
  }

  void list_tasks() {
    auto tasks = orchestrator_->active_tasks();
    if(tasks.empty()) {
      out_ << "No active tasks.\n";
      return;
    }
    for(const auto& task : tasks) {
      out_ << std::left << std::setw(38) << task.id
           << std::setw(13) << to_string(task.state)
           << task.display_name << "\n";
    }
  }

  void list_history() {
    auto outcomes = orchestrator_->history();
    if(outcomes.empty()) {
      out_ << "No finished tasks.\n";
      return;
    }
    for(const auto& outcome : outcomes) {
      std::time_t when = std::chrono::system_clock::to_time_t(outcome.finished_at);
      std::tm local{};
      localtime_r(&when, &local);
      out_ << std::put_time(&local, "%H:%M:%S") << "  "
           << std::left << std::setw(10) << to_string(outcome.state)
           << outcome.display_name;
      if(!outcome.view_link.empty()) out_ << "  " << outcome.view_link;
      if(outcome.state == TaskState::Failed) out_ << "  (" << to_string(outcome.error) << ")";
      out_ << "\n";
    }
  }

  void show_setting(const std::string& key) {
    out_ << key << " = " << settings_->value_as_string(key) << "\n";
  }

  // settings list | get <key> | set <key> <value> | save | load
  void handle_settings_command(const std::string& args) {
    if(!settings_) {
      out_ << "Settings manager unavailable.\n";
      return;
    }
    std::istringstream iss(args);
    std::string action, key;
    iss >> action >> key;

    if(action == "list") {
      for(const auto& def : settings_->definitions()) show_setting(def.key);
    } else if(action == "get" || action == "set") {
      const auto* def = key.empty() ? nullptr : settings_->definition(key);
      std::string value;
      std::getline(iss, value);
      value = trim_copy(value);
      if(key.empty() || (action == "set" && value.empty())) {
        out_ << "Usage: settings " << action << (action == "set" ? " <key> <value>\n" : " <key>\n");
      } else if(!def) {
        out_ << "Unknown setting '" << key << "'.\n";
      } else if(action == "get") {
        show_setting(def->key);
      } else {
        apply_setting(*def, value);
      }
    } else if(action == "save") {
      out_ << (settings_->save() ? "Saved settings to " + settings_->settings_path().string()
                                 : std::string("Failed to save settings.")) << "\n";
    } else if(action == "load") {
      out_ << (settings_->load() ? "Loaded settings from " + settings_->settings_path().string()
                                 : std::string("Settings file not found; keeping current values.")) << "\n";
    } else {
      out_ << "Unknown settings command.\n";
    }
  }

  void apply_setting(const SettingDefinition& def, const std::string& value) {
    std::string error;
    if(!settings_->set_from_string(def.key, value, error)) {
      out_ << "Failed to set " << def.key << ": " << error << "\n";
      return;
    }
    show_setting(def.key);
    if(def.key == "verbose" || def.key == "log_file") {
      init(settings_->get<bool>("verbose"), settings_->get<std::string>("log_file"));
    } else if(def.persistent) {
      out_ << "  (takes effect on restart; use 'settings save' to keep it)\n";
    }
  }

  void print_help() {
    out_ << "Available commands:\n";
    out_ << "  help|h|?                          Show this help message\n";
    out_ << "  quit                              Cancel running tasks and exit\n";
    out_ << "  start <url> [name]                Prepare a download (title is fetched when no name is given)\n";
    out_ << "  quality|q <job> <best|1080|720|480>  Choose the quality and start the task\n";
    out_ << "  cancel|c <task>                   Cancel a task by id or unique id prefix\n";
    out_ << "  tasks|t                           List active tasks\n";
    out_ << "  history                           List recently finished tasks\n";
    out_ << "  settings [list|get|set|save|load] Manage runtime settings\n";
  }

  std::shared_ptr<TaskOrchestrator> orchestrator_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<ConsoleSink> sink_;
  std::ostream& out_;
  std::atomic<bool> running_;
  std::thread cli_thread_;
  std::string input_buffer_;
  std::function<void()> on_quit_;
};
