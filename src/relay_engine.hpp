#pragma once

#include <asio.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "log.hpp"

class ConsoleSink;
class CredentialProvider;
class NotificationSink;
class RelayCLI;
class SettingsManager;
class StorageService;
class TaskOrchestrator;

// Wires settings into the registry, drivers, notifier and orchestrator, and
// owns the operator console and the shutdown signal handling.
class RelayEngine {
public:
  struct Options {
    bool start_cli_thread = false;
    bool handle_signals = true;
    std::filesystem::path workspace_root = std::filesystem::current_path();
    std::ostream* console = &std::cout;
    // Overrides for the default console sink, token file and local storage.
    std::shared_ptr<NotificationSink> sink;
    std::shared_ptr<CredentialProvider> credentials;
    std::shared_ptr<StorageService> storage;
  };

  RelayEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~RelayEngine();

  void start();
  // Blocks until the console quits or SIGINT/SIGTERM arrives.
  void run();
  void stop();

  bool execute_command(const std::string& line);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<TaskOrchestrator> orchestrator() const { return orchestrator_; }

  std::filesystem::path resolve_path(const std::string& value) const;

private:
  void ensure_workspace() const;
  void request_shutdown(const std::string& reason);

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::unique_ptr<asio::signal_set> signals_;
  std::shared_ptr<ConsoleSink> console_sink_;
  std::shared_ptr<TaskOrchestrator> orchestrator_;
  std::unique_ptr<RelayCLI> cli_;
  bool started_ = false;
};
