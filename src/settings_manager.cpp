#include "settings_manager.hpp"

#include <algorithm>
#include <fstream>

#include "log.hpp"
#include "utils.hpp"

namespace {

SettingKind kind_from_name(const std::string& name) {
  if(name == "bool") return SettingKind::Bool;
  if(name == "int") return SettingKind::Int;
  if(name == "string") return SettingKind::String;
  if(name == "list") return SettingKind::List;
  throw std::runtime_error("Unknown setting type '" + name + "'");
}

std::vector<SettingDefinition> parse_table(const nlohmann::json& table) {
  std::vector<SettingDefinition> out;
  for(const auto& row : table) {
    SettingDefinition def;
    def.key = row.at("key").get<std::string>();
    for(const auto& alias : row.value("aliases", nlohmann::json::array())) {
      def.aliases.push_back(to_lower(alias.get<std::string>()));
    }
    def.kind = kind_from_name(row.at("type").get<std::string>());
    def.default_value = row.at("default");
    def.description = row.value("description", "");
    if(row.contains("min")) def.minimum = row.at("min").get<long long>();
    def.persistent = row.value("persistent", true);
    out.push_back(std::move(def));
  }
  return out;
}

std::optional<bool> parse_switch(const std::string& text) {
  const auto v = to_lower(text);
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

} // namespace

SettingsManager::SettingsManager()
  : SettingsManager(RELAY_SETTINGS) {}

SettingsManager::SettingsManager(const nlohmann::json& table)
  : definitions_(parse_table(table)),
    values_(nlohmann::json::object()) {
  for(const auto& def : definitions_) {
    values_[def.key] = def.default_value;
  }
}

const SettingDefinition* SettingsManager::definition(const std::string& token) const {
  const auto wanted = to_lower(trim_copy(token));
  auto it = std::find_if(definitions_.begin(), definitions_.end(), [&](const SettingDefinition& def){
    return to_lower(def.key) == wanted ||
           std::find(def.aliases.begin(), def.aliases.end(), wanted) != def.aliases.end();
  });
  return it == definitions_.end() ? nullptr : &*it;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* def = definition(token)) return def->key;
  return std::nullopt;
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  for(const auto& def : definitions_) out.push_back(def.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  auto it = values_.find(key);
  if(it == values_.end()) return "<unknown>";
  if(it->is_string()) return it->get<std::string>();
  return it->dump();
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& text,
                                      std::string& error) {
  const auto* def = definition(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  const std::string clean = trim_copy(text);
  switch(def->kind) {
    case SettingKind::Bool: {
      auto flag = parse_switch(clean);
      if(!flag) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      return store(*def, *flag, error);
    }
    case SettingKind::Int: {
      long long parsed = 0;
      std::size_t consumed = 0;
      try {
        parsed = std::stoll(clean, &consumed);
      } catch(const std::exception&) {
        error = "expected integer";
        return false;
      }
      if(consumed != clean.size()) {
        error = "trailing characters after integer";
        return false;
      }
      return store(*def, parsed, error);
    }
    case SettingKind::List: {
      auto parsed = nlohmann::json::parse(clean, nullptr, false);
      if(parsed.is_discarded()) {
        error = "invalid JSON";
        return false;
      }
      return store(*def, parsed, error);
    }
    case SettingKind::String:
      break;
  }
  return store(*def, clean, error);
}

bool SettingsManager::store(const SettingDefinition& def,
                            const nlohmann::json& value,
                            std::string& error) {
  switch(def.kind) {
    case SettingKind::Bool:
      if(value.is_number_integer()) {
        values_[def.key] = value.get<long long>() != 0;
        return true;
      }
      if(!value.is_boolean()) {
        error = "expected boolean";
        return false;
      }
      break;
    case SettingKind::Int:
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      if(def.minimum && value.get<long long>() < *def.minimum) {
        error = "must be at least " + std::to_string(*def.minimum);
        return false;
      }
      break;
    case SettingKind::String:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      break;
    case SettingKind::List:
      if(!value.is_array()) {
        error = "expected JSON array";
        return false;
      }
      break;
  }
  values_[def.key] = value;
  return true;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

nlohmann::json SettingsManager::persistent_values() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& def : definitions_) {
    if(def.persistent) doc[def.key] = values_.at(def.key);
  }
  return doc;
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(path.empty() || !in) return false;

  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: top level is not an object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* def = definition(item.key());
    if(!def) {
      log_warn(nullptr, "Ignoring unknown setting '{}'", item.key());
      continue;
    }
    std::string error;
    if(!store(*def, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  if(path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << persistent_values().dump(2);
  return static_cast<bool>(out);
}
