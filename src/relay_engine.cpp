#include "relay_engine.hpp"

#include <csignal>
#include <stdexcept>

#include "RelayCLI.hpp"
#include "console_sink.hpp"
#include "download_driver.hpp"
#include "file_credential_provider.hpp"
#include "local_storage_service.hpp"
#include "rate_limited_notifier.hpp"
#include "settings_manager.hpp"
#include "task_orchestrator.hpp"
#include "task_registry.hpp"
#include "upload_driver.hpp"

namespace {

std::chrono::milliseconds positive_ms(long long value, long long fallback) {
  return std::chrono::milliseconds(value > 0 ? value : fallback);
}

} // namespace

RelayEngine::RelayEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("relay")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
  if(!options_.console) options_.console = &std::cout;
}

RelayEngine::~RelayEngine() {
  stop();
}

std::filesystem::path RelayEngine::resolve_path(const std::string& value) const {
  std::filesystem::path path(value);
  if(path.is_relative()) path = options_.workspace_root / path;
  return path;
}

void RelayEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
}

void RelayEngine::start() {
  if(started_) return;
  started_ = true;

  ensure_workspace();
  if(settings_->settings_path().empty()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "settings.json");
  }

  const auto log_file = settings_->get<std::string>("log_file");
  init(settings_->get<bool>("verbose"), log_file.empty() ? std::string() : resolve_path(log_file).string());

  auto registry = std::make_shared<TaskRegistry>(
    positive_ms(settings_->get<long long>("terminate_grace_ms"), 2000), logger_);

  DownloadDriver::Options download_options;
  download_options.retriever = settings_->get<std::string>("retriever");
  download_options.remux_format = settings_->get<std::string>("remux_format");
  download_options.poll_interval = positive_ms(settings_->get<long long>("poll_interval_ms"), 250);
  download_options.terminate_grace = positive_ms(settings_->get<long long>("terminate_grace_ms"), 2000);
  auto headers = settings_->get<nlohmann::json>("retriever_headers");
  download_options.headers.clear();
  for(const auto& header : headers) {
    if(header.is_string()) download_options.headers.push_back(header.get<std::string>());
  }
  auto download = std::make_shared<DownloadDriver>(download_options, registry, logger_);

  auto credentials = options_.credentials;
  if(!credentials) {
    credentials = std::make_shared<FileCredentialProvider>(
      resolve_path(settings_->get<std::string>("credential_file")), logger_);
  }
  auto storage = options_.storage;
  if(!storage) {
    const auto chunk = settings_->get<long long>("upload_chunk_size");
    storage = std::make_shared<LocalStorageService>(
      resolve_path(settings_->get<std::string>("storage_root")),
      static_cast<std::size_t>(chunk > 0 ? chunk : 5 * 1024 * 1024),
      logger_);
  }
  UploadDriver::Options upload_options;
  upload_options.container_id = settings_->get<std::string>("destination_container");
  auto upload = std::make_shared<UploadDriver>(upload_options, credentials, storage, logger_);

  console_sink_ = std::make_shared<ConsoleSink>(*options_.console);
  std::shared_ptr<NotificationSink> sink = options_.sink ? options_.sink : console_sink_;

  RateLimitedNotifier::Options notify_options;
  notify_options.interval = positive_ms(settings_->get<long long>("notify_interval_ms"), 1000);
  const auto bar_width = settings_->get<long long>("progress_bar_width");
  notify_options.bar_width = static_cast<std::size_t>(bar_width > 0 ? bar_width : 20);
  auto notifier = std::make_shared<RateLimitedNotifier>(sink, notify_options, logger_);

  TaskOrchestrator::Options orchestrator_options;
  orchestrator_options.work_dir = resolve_path(settings_->get<std::string>("work_dir"));
  const auto parallel = settings_->get<long long>("max_parallel_tasks");
  orchestrator_options.max_parallel_tasks = static_cast<std::size_t>(parallel > 0 ? parallel : 8);
  orchestrator_options.mirror_link_template = settings_->get<std::string>("mirror_link_template");

  std::error_code ec;
  std::filesystem::create_directories(orchestrator_options.work_dir, ec);
  if(ec) {
    logger_->warn("Unable to create work directory {}: {}", orchestrator_options.work_dir.string(), ec.message());
  }

  orchestrator_ = std::make_shared<TaskOrchestrator>(orchestrator_options,
                                                     registry,
                                                     download,
                                                     upload,
                                                     notifier,
                                                     logger_);

  cli_ = std::make_unique<RelayCLI>(orchestrator_, settings_, console_sink_, *options_.console);
  cli_->set_quit_callback([this]{
    asio::post(io_, [this]{ request_shutdown("console closed"); });
  });

  if(options_.handle_signals) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& error, int signo){
      if(error) return;
      request_shutdown(signo == SIGINT ? "SIGINT" : "SIGTERM");
    });
  }

  if(options_.start_cli_thread) {
    cli_->start();
  }
  logger_->info("Relay ready (work dir {}, retriever {})",
                orchestrator_options.work_dir.string(), download_options.retriever);
}

void RelayEngine::request_shutdown(const std::string& reason) {
  logger_->info("Shutting down ({})", reason);
  if(orchestrator_) {
    auto cancelled = orchestrator_->cancel_all();
    if(cancelled > 0) logger_->info("Cancelled {} active task(s)", cancelled);
  }
  io_.stop();
}

void RelayEngine::run() {
  if(!started_) start();
  auto guard = asio::make_work_guard(io_);
  io_.run();
}

void RelayEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(cli_) cli_->stop();
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  io_.stop();
  if(orchestrator_) {
    orchestrator_->cancel_all();
    orchestrator_->wait_idle();
  }
  io_.restart();
}

bool RelayEngine::execute_command(const std::string& line) {
  if(!started_) start();
  return cli_->execute(line);
}

