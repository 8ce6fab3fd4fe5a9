#include "command_line_parser.hpp"

#include <cctype>

#include "log.hpp"
#include "utils.hpp"

namespace {

bool looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() > 1 && token[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(token[1]));
}

bool is_switch_word(const std::string& token) {
  static const char* const kWords[] = {"true", "false", "on", "off", "yes", "no", "1", "0"};
  const auto lowered = to_lower(trim_copy(token));
  for(const char* word : kWords) {
    if(lowered == word) return true;
  }
  return false;
}

const char* kind_hint(SettingKind kind) {
  switch(kind) {
    case SettingKind::Bool: return "[true|false]";
    case SettingKind::Int: return "<int>";
    case SettingKind::List: return "<json array>";
    case SettingKind::String: break;
  }
  return "<string>";
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {}

bool CommandLineParser::apply_option(const std::vector<std::string>& args, std::size_t& i,
                                     SettingsManager& settings, std::string& problem) const {
  const std::string& token = args[i];
  const std::string name = token.substr(token.rfind("--", 0) == 0 ? 2 : 1);
  const auto* def = settings.definition(name);
  if(!def) {
    problem = "Unknown option " + token;
    return false;
  }

  std::string value = "true";
  const bool has_next = i + 1 < args.size();
  if(def->kind == SettingKind::Bool) {
    if(has_next && !looks_like_option(args[i + 1]) && is_switch_word(args[i + 1])) {
      value = args[++i];
    }
  } else if(has_next) {
    value = args[++i];
  } else {
    problem = "Missing value for option '" + name + "'";
    return false;
  }

  std::string error;
  if(!settings.set_from_string(def->key, value, error)) {
    problem = "Invalid value for option '" + name + "': " + error;
    return false;
  }
  return true;
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);

  std::string problem;
  std::size_t next_positional = 0;
  for(std::size_t i = 0; i < args.size() && problem.empty(); ++i) {
    if(args[i].size() > 1 && args[i][0] == '-') {
      apply_option(args, i, settings, problem);
      continue;
    }
    if(next_positional >= positional_keys_.size()) {
      problem = "Unexpected positional argument '" + args[i] + "'";
      break;
    }
    const auto& key = positional_keys_[next_positional++];
    std::string error;
    if(!settings.set_from_string(key, args[i], error)) {
      problem = "Invalid value for " + key + " '" + args[i] + "': " + error;
    }
  }

  if(problem.empty()) return true;
  print_err(nullptr, "{}", problem);
  usage(settings);
  return false;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";

  print_out(nullptr, "{} - fetch media with a retriever and publish it to storage", process_name_);
  print_out(nullptr, "Usage:\n  {}\n\nOptions:", synopsis);
  for(const auto& def : settings.definitions()) {
    std::string aliases;
    for(const auto& alias : def.aliases) {
      aliases += (aliases.empty() ? " (alias: -" : ", -") + alias;
    }
    if(!aliases.empty()) aliases += ")";
    const std::string fallback = def.default_value.is_string()
      ? def.default_value.get<std::string>()
      : def.default_value.dump();
    print_out(nullptr, "  --{} {:<14} {}{} (default: {})",
              def.key, kind_hint(def.kind), def.description, aliases, fallback);
  }
  print_out(nullptr, "");
}
