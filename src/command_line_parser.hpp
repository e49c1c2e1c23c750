#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// argv on top of the loaded settings: `--key value`, `-alias value`, bare
// boolean flags (`--verbose`, `--verbose off`) and positional tier roots.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name,
                             std::vector<std::string> positional_keys = {"fast_root", "slow_root"});

  // False with `error` set at the first bad token; earlier tokens stay applied.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  // Lists every setting with its current value.
  void usage(const SettingsManager& settings) const;

private:
  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
