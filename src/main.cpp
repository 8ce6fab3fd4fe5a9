#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <optional>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "relay_engine.hpp"
#include "settings_manager.hpp"

namespace {

// Saved settings first, argv on top. Returns an exit code when the process
// should stop before the engine starts.
std::optional<int> apply_startup_settings(SettingsManager& settings, int argc, char** argv) {
  settings.load();
  CommandLineParser parser(argc > 0 && argv && argv[0] ? argv[0] : "relay");
  if(!parser.parse(argc, argv, settings)) return 2;
  if(settings.help_requested()) {
    parser.usage(settings);
    return 0;
  }
  return std::nullopt;
}

int run_relay(int argc, char** argv) {
  RelayEngine::Options options;
  options.workspace_root = std::filesystem::current_path();
  options.start_cli_thread = true;

  RelayEngine engine(nullptr, options);
  auto settings = engine.settings();
  settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
  if(auto code = apply_startup_settings(*settings, argc, argv)) return *code;

  engine.start();
  auto logger = engine.logger();
  if(settings->save_requested() && !settings->save()) {
    logger->error("Unable to persist settings to {}", settings->settings_path().string());
  }
  logger->debug("Workspace {}", options.workspace_root.string());
  if(settings->get<std::string>("destination_container").empty()) {
    logger->warn("No destination_container configured; uploads go to the storage root's default folder");
  }
  engine.run();
  engine.stop();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  try {
    return run_relay(argc, argv);
  } catch(const std::exception& e) {
    init(false);
    Logger("relay-main").error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
