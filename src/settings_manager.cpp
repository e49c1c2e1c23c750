#include "settings_manager.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <system_error>

#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

SettingsManager::Type parse_type(const std::string& key, const std::string& name) {
  if(name == "bool") return SettingsManager::Type::Bool;
  if(name == "int") return SettingsManager::Type::Int;
  if(name == "string") return SettingsManager::Type::String;
  throw std::invalid_argument("Setting '" + key + "' has unknown type '" + name + "'");
}

std::optional<long long> bound(const nlohmann::json& entry, const char* name) {
  if(!entry.contains(name)) return std::nullopt;
  return entry.at(name).get<long long>();
}

std::optional<bool> parse_bool(const std::string& text) {
  const auto v = to_lower(text);
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

} // namespace

SettingsManager::SettingsManager(const nlohmann::json& specification) {
  try {
    for(const auto& entry : specification) {
      Setting setting;
      setting.key = entry.at("key").get<std::string>();
      for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
        setting.aliases.push_back(to_lower(alias));
      }
      setting.type = parse_type(setting.key, entry.at("type").get<std::string>());
      setting.default_value = entry.at("default");
      setting.description = entry.value("description", "");
      setting.min = bound(entry, "min");
      setting.max = bound(entry, "max");
      setting.persistent = entry.value("persistent", true);
      setting.secret = entry.value("secret", false);
      settings_.push_back(std::move(setting));
    }
  } catch(const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("Malformed settings table: ") + e.what());
  }
  for(const auto& setting : settings_) {
    std::string error;
    if(!store(setting, setting.default_value, error)) {
      throw std::invalid_argument("Default for '" + setting.key + "' is invalid: " + error);
    }
  }
}

const SettingsManager::Setting* SettingsManager::find(const std::string& key_or_alias) const {
  const auto token = to_lower(key_or_alias);
  for(const auto& setting : settings_) {
    if(to_lower(setting.key) == token ||
       std::find(setting.aliases.begin(), setting.aliases.end(), token) != setting.aliases.end()) {
      return &setting;
    }
  }
  return nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& key_or_alias) const {
  if(const auto* setting = find(key_or_alias)) return setting->key;
  return std::nullopt;
}

bool SettingsManager::store(const Setting& setting, const nlohmann::json& value, std::string& error) {
  switch(setting.type) {
    case Type::Bool:
      if(!value.is_boolean()) {
        error = "expected true or false";
        return false;
      }
      break;
    case Type::Int: {
      if(!value.is_number_integer()) {
        error = "expected an integer";
        return false;
      }
      const auto number = value.get<long long>();
      if(setting.min && number < *setting.min) {
        error = "must be at least " + std::to_string(*setting.min);
        return false;
      }
      if(setting.max && number > *setting.max) {
        error = "must be at most " + std::to_string(*setting.max);
        return false;
      }
      break;
    }
    case Type::String:
      if(!value.is_string()) {
        error = "expected a string";
        return false;
      }
      break;
  }
  values_[setting.key] = value;
  return true;
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting '" + key + "'";
    return false;
  }
  const auto text = trim(value);
  switch(setting->type) {
    case Type::Bool: {
      auto parsed = parse_bool(text);
      if(!parsed) {
        error = "expected true|false|on|off|yes|no|1|0";
        return false;
      }
      return store(*setting, *parsed, error);
    }
    case Type::Int: {
      long long parsed = 0;
      const char* end = text.data() + text.size();
      auto result = std::from_chars(text.data(), end, parsed);
      if(text.empty() || result.ec != std::errc() || result.ptr != end) {
        error = "expected an integer, got '" + text + "'";
        return false;
      }
      return store(*setting, parsed, error);
    }
    case Type::String:
      return store(*setting, text, error);
  }
  error = "unsupported setting type";
  return false;
}

bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting '" + key + "'";
    return false;
  }
  return store(*setting, value, error);
}

bool SettingsManager::load() {
  std::ifstream in(settings_path_);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::parse_error& e) {
    print_err("Ignoring {}: {}", settings_path_.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err("Ignoring {}: expected a JSON object", settings_path_.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* setting = find(item.key());
    if(!setting || !setting->persistent) continue;
    std::string error;
    if(!store(*setting, item.value(), error)) {
      print_err("Ignoring setting '{}' in {}: {}", item.key(), settings_path_.string(), error);
    }
  }
  return true;
}

bool SettingsManager::save() const {
  std::error_code ec;
  if(settings_path_.has_parent_path()) {
    fs::create_directories(settings_path_.parent_path(), ec);
  }
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& setting : settings_) {
    if(setting.persistent) doc[setting.key] = values_.at(setting.key);
  }
  std::ofstream out(settings_path_, std::ios::trunc);
  if(!out) {
    print_err("Unable to write {}", settings_path_.string());
    return false;
  }
  out << doc.dump(2) << '\n';
  return static_cast<bool>(out);
}

std::string SettingsManager::display_value(const std::string& key) const {
  const auto* setting = find(key);
  if(!setting) return "<unknown>";
  const auto& value = values_.at(setting->key);
  if(value.is_string()) {
    auto text = value.get<std::string>();
    return (setting->secret && !text.empty()) ? "***" : text;
  }
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}
