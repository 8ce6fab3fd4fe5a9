#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto settings: "--key value", "-alias value", bare "--flag" for
// booleans, then positional values in order.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "relay",
                             std::vector<std::string> positional_keys = {"destination_container"});

  // Returns false after printing the problem and usage.
  bool parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  bool apply_option(const std::vector<std::string>& args, std::size_t& i,
                    SettingsManager& settings, std::string& problem) const;

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
