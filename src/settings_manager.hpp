#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every runtime knob of the relay. "min" bounds integer settings from below.
inline const nlohmann::json RELAY_SETTINGS = nlohmann::json::array({
  {{"key","work_dir"},              {"aliases", {"wd","downloads"}},   {"type","string"}, {"default","downloads"},  {"description","Directory for in-flight downloaded artifacts"}},
  {{"key","storage_root"},          {"aliases", {"sr","storage"}},     {"type","string"}, {"default","storage"},    {"description","Root directory of the local storage service"}},
  {{"key","destination_container"}, {"aliases", {"dc","folder"}},      {"type","string"}, {"default",""},           {"description","Destination container (folder) id for uploads"}},
  {{"key","credential_file"},       {"aliases", {"cf","token"}},       {"type","string"}, {"default","token.json"}, {"description","JSON file holding the storage access token"}},
  {{"key","retriever"},             {"aliases", {"rt"}},               {"type","string"}, {"default","yt-dlp"},     {"description","Retrieval executable"}},
  {{"key","retriever_headers"},     {"aliases", {"headers"}},          {"type","list"},
     {"default", nlohmann::json::array({"Origin: https://www.mediasetinfinity.es",
                                        "Referer: https://www.mediasetinfinity.es"})},
     {"description","HTTP headers passed to the retriever (JSON array)"}},
  {{"key","remux_format"},          {"aliases", {"remux"}},            {"type","string"}, {"default","mp4"},        {"description","Container the retriever remuxes into"}},
  {{"key","poll_interval_ms"},      {"aliases", {"poll","pim"}},       {"type","int"}, {"min",1},    {"default",250},     {"description","Read cycle length while supervising the retriever"}},
  {{"key","terminate_grace_ms"},    {"aliases", {"grace"}},            {"type","int"}, {"min",0},    {"default",2000},    {"description","Milliseconds between SIGTERM and SIGKILL on cancel"}},
  {{"key","notify_interval_ms"},    {"aliases", {"notify","nim"}},     {"type","int"}, {"min",0},    {"default",1000},    {"description","Minimum milliseconds between progress message edits"}},
  {{"key","progress_bar_width"},    {"aliases", {"bar","pbw"}},        {"type","int"}, {"min",1},    {"default",20},      {"description","Segments in the rendered progress bar"}},
  {{"key","upload_chunk_size"},     {"aliases", {"chunk","ucs"}},      {"type","int"}, {"min",1024}, {"default",5242880}, {"description","Bytes transferred per upload chunk"}},
  {{"key","max_parallel_tasks"},    {"aliases", {"parallel","mpt"}},   {"type","int"}, {"min",1},    {"default",8},       {"description","Worker threads available to task units"}},
  {{"key","mirror_link_template"},  {"aliases", {"mirror"}},           {"type","string"}, {"default",""},           {"description","Mirror URL template, {id} is replaced by the remote id"}},
  {{"key","log_file"},              {"aliases", {"log"}},              {"type","string"}, {"default",""},           {"description","Also write log output to this file"}},
  {{"key","verbose"},               {"aliases", {"v"}},                {"type","bool"},   {"default",false},        {"description","Enable verbose logging"}},
  {{"key","help"},                  {"aliases", {"h","?"}},            {"type","bool"},   {"default",false},        {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                  {"aliases", {"persist"}},          {"type","bool"},   {"default",false},        {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingKind { Bool, Int, String, List };

struct SettingDefinition {
  std::string key;
  std::vector<std::string> aliases;   // lowercase
  SettingKind kind = SettingKind::String;
  nlohmann::json default_value;
  std::string description;
  std::optional<long long> minimum;
  bool persistent = true;
};

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& table);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const { return values_.contains(key); }

  // Accepts a key or any alias, case-insensitively.
  const SettingDefinition* definition(const std::string& token) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  const std::vector<SettingDefinition>& definitions() const { return definitions_; }

  // Parses console or argv text for the setting. On failure error says why
  // and the stored value is unchanged.
  bool set_from_string(const std::string& key, const std::string& text, std::string& error);

  std::string value_as_string(const std::string& key) const;
  std::vector<std::string> keys() const;

  bool save() const { return save_to_file(settings_path()); }
  bool load() { return load_from_file(settings_path()); }
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { settings_path_override_ = path; }

private:
  bool store(const SettingDefinition& def, const nlohmann::json& value, std::string& error);
  nlohmann::json persistent_values() const;

  std::vector<SettingDefinition> definitions_;
  nlohmann::json values_;
  std::filesystem::path settings_path_override_;
};

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  auto it = values_.find(key);
  if(it == values_.end()) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return it->template get<T>();
}
