#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every knob safemover reads. Integers may carry "min"/"max" bounds that are
// enforced whenever a value is set or loaded; "secret" values are masked when
// listed; "persistent": false keys only live for one run.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","fast_root"},          {"aliases", {"fast","fr"}},     {"type","string"}, {"default",""},          {"description","Fast tier root folder"}},
  {{"key","slow_root"},          {"aliases", {"slow","sr"}},     {"type","string"}, {"default",""},          {"description","Slow tier root folder"}},
  {{"key","data_dir"},           {"aliases", {"data"}},          {"type","string"}, {"default","data"},      {"description","Directory holding queue.json and history.json"}},
  {{"key","temp_dir"},           {"aliases", {"tmp"}},           {"type","string"}, {"default","/tmp"},      {"description","Scratch directory for encoded and remuxed artifacts"}},
  {{"key","history_limit"},      {"aliases", {"hl"}},            {"type","int"},    {"default",10},          {"min",1}, {"max",10000}, {"description","Number of finished jobs kept in history"}},
  {{"key","poll_interval_ms"},   {"aliases", {"poll"}},          {"type","int"},    {"default",1000},        {"min",1}, {"max",3600000}, {"description","Idle worker poll interval"}},
  {{"key","progress_flush_ms"},  {"aliases", {"pf"}},            {"type","int"},    {"default",500},         {"min",0}, {"max",3600000}, {"description","Minimum milliseconds between persisted progress writes"}},
  {{"key","digest_algorithm"},   {"aliases", {"digest"}},        {"type","string"}, {"default","XXH3_128"},  {"description","Verification digest: XXH3_128, or any OpenSSL digest name"}},
  {{"key","digest_block_size"},  {"aliases", {"block"}},         {"type","int"},    {"default",8388608},     {"min",4096}, {"max",1073741824}, {"description","Read block size for digest and copy"}},
  {{"key","catalog_host"},       {"aliases", {"ch"}},            {"type","string"}, {"default","localhost"}, {"description","Catalog service host"}},
  {{"key","catalog_port"},       {"aliases", {"cp"}},            {"type","int"},    {"default",7878},        {"min",1}, {"max",65535}, {"description","Catalog service port"}},
  {{"key","catalog_api_key"},    {"aliases", {"api_key","key"}}, {"type","string"}, {"default",""},          {"secret", true}, {"description","Catalog API key"}},
  {{"key","catalog_api_base"},   {"aliases", {"api_base"}},      {"type","string"}, {"default","/api/v3"},   {"description","Catalog API path prefix"}},
  {{"key","catalog_timeout_ms"}, {"aliases", {"ct"}},            {"type","int"},    {"default",30000},       {"min",1}, {"max",3600000}, {"description","Catalog request deadline"}},
  {{"key","ffprobe_path"},       {"aliases", {"ffprobe"}},       {"type","string"}, {"default","ffprobe"},   {"description","Media prober executable"}},
  {{"key","ffmpeg_path"},        {"aliases", {"ffmpeg"}},        {"type","string"}, {"default","ffmpeg"},    {"description","Audio transcoder executable"}},
  {{"key","mkvmerge_path"},      {"aliases", {"mkvmerge"}},      {"type","string"}, {"default","mkvmerge"},  {"description","Container remuxer executable"}},
  {{"key","verbose"},            {"aliases", {"v"}},             {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}},
  {{"key","log_file"},           {"aliases", {"log"}},           {"type","string"}, {"default",""},          {"description","Rotating log file (empty = console only)"}},
  {{"key","help"},               {"aliases", {"h","?"}},         {"type","bool"},   {"default",false},       {"persistent", false}, {"description","Show command help and exit"}},
  {{"key","save"},               {"aliases", {"persist"}},       {"type","bool"},   {"default",false},       {"persistent", false}, {"description","Persist current settings to disk"}},
  {{"key","no_console"},         {"aliases", {"headless"}},      {"type","bool"},   {"default",false},       {"persistent", false}, {"description","Run without the interactive console"}}
});

class SettingsManager {
public:
  enum class Type { Bool, Int, String };

  struct Setting {
    std::string key;
    std::vector<std::string> aliases;   // lowercase
    Type type = Type::String;
    nlohmann::json default_value;
    std::string description;
    std::optional<long long> min;
    std::optional<long long> max;
    bool persistent = true;
    bool secret = false;
  };

  // std::invalid_argument for a malformed table or a default outside its bounds.
  explicit SettingsManager(const nlohmann::json& specification = SETTINGS_SPECIFICATION);

  template<typename T>
  T get(const std::string& key) const {
    if(!values_.contains(key)) {
      throw std::out_of_range("Unknown setting: " + key);
    }
    return values_.at(key).get<T>();
  }

  // Both accept a key or an alias; on failure nothing changes.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // False when there is no settings file. A damaged file or an invalid entry
  // is reported on stderr and skipped.
  bool load();
  bool save() const;

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  // Table order.
  const std::vector<Setting>& settings() const { return settings_; }
  const Setting* find(const std::string& key_or_alias) const;
  std::optional<std::string> resolve_key(const std::string& key_or_alias) const;
  // Secrets come back masked.
  std::string display_value(const std::string& key) const;

  const std::filesystem::path& settings_path() const { return settings_path_; }
  void set_settings_path(std::filesystem::path path) { settings_path_ = std::move(path); }

private:
  bool store(const Setting& setting, const nlohmann::json& value, std::string& error);

  std::vector<Setting> settings_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_ = std::filesystem::current_path() / ".config" / "settings.json";
};
