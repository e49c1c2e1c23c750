#include "command_line_parser.hpp"

#include <cctype>
#include <utility>

#include "log.hpp"

namespace {

// "-5" stays a value so negative numbers can follow an option.
bool looks_like_option(const std::string& token) {
  return token.size() > 1 && token[0] == '-' &&
         !std::isdigit(static_cast<unsigned char>(token[1]));
}

std::string value_hint(const SettingsManager::Setting& setting) {
  switch(setting.type) {
    case SettingsManager::Type::Bool:
      return "[on|off]";
    case SettingsManager::Type::Int:
      if(setting.min && setting.max) return fmt::format("<{}..{}>", *setting.min, *setting.max);
      return "<n>";
    case SettingsManager::Type::String:
      break;
  }
  return "<text>";
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name, std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  error.clear();
  std::size_t next_positional = 0;
  for(int i = 1; i < argc; ++i) {
    const std::string token = argv[i];

    if(looks_like_option(token)) {
      const auto name = token.substr(token.rfind("--", 0) == 0 ? 2 : 1);
      const auto* setting = settings.find(name);
      if(!setting) {
        error = "Unknown option " + token;
        return false;
      }
      std::string set_error;
      if(setting->type == SettingsManager::Type::Bool) {
        // A following on/off word belongs to the flag; anything else does not.
        if(i + 1 < argc && !looks_like_option(argv[i + 1]) &&
           settings.set_from_string(setting->key, argv[i + 1], set_error)) {
          ++i;
        } else if(!settings.set_from_json(setting->key, true, set_error)) {
          error = "Invalid flag " + token + ": " + set_error;
          return false;
        }
        continue;
      }
      if(i + 1 >= argc) {
        error = "Missing value for " + token;
        return false;
      }
      if(!settings.set_from_string(setting->key, argv[++i], set_error)) {
        error = "Invalid value for " + token + ": " + set_error;
        return false;
      }
      continue;
    }

    if(next_positional >= positional_keys_.size()) {
      error = "Unexpected argument '" + token + "'";
      return false;
    }
    const auto& key = positional_keys_[next_positional++];
    std::string set_error;
    if(!settings.set_from_string(key, token, set_error)) {
      error = "Invalid " + key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& key : positional_keys_) {
    synopsis += " [" + key + "]";
  }
  print_out("{} - verified media mover for tiered storage", process_name_);
  print_out("");
  print_out("Usage: {}", synopsis);
  print_out("");
  print_out("Options (current value in brackets):");
  for(const auto& setting : settings.settings()) {
    std::string flags = "--" + setting.key;
    for(const auto& alias : setting.aliases) {
      flags += ", -" + alias;
    }
    print_out("  {:<36} {:<18} {} [{}]",
              flags, value_hint(setting), setting.description, settings.display_value(setting.key));
  }
}
