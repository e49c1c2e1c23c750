#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "media_subject.hpp"

class Logger;

// Lifecycle of a queued job. Handlers report finer progress through
// QueueItem::status, which stays free text.
enum class ItemState { Pending, Processing, Completed, Failed };

const char* to_string(ItemState state);
// std::nullopt for anything other than the four lowercase names.
std::optional<ItemState> item_state_from_string(const std::string& text);

struct QueueItem {
  std::string id;
  MediaSubject subject;
  std::string operation_type;
  ItemState state = ItemState::Pending;
  std::string status;                     // handler sub-state, e.g. "copying"
  std::string progress;
  std::string added_at;
  std::string started_at;
  std::string completed_at;
  std::string failed_at;
};

struct HistoryRecord {
  std::string title;
  std::string operation_type;
  bool success = false;
  std::string timestamp;
  std::optional<std::string> error;
  std::string error_kind;                 // empty on success
};

nlohmann::json queue_item_to_json(const QueueItem& item);
QueueItem queue_item_from_json(const nlohmann::json& doc);
nlohmann::json history_record_to_json(const HistoryRecord& record);
HistoryRecord history_record_from_json(const nlohmann::json& doc);

// queue.json and history.json under one data directory. Each save rewrites
// the whole document through a temporary file and a rename.
class QueueStore {
public:
  QueueStore(std::filesystem::path data_dir, std::shared_ptr<Logger> logger);

  std::vector<QueueItem> load_queue();
  std::vector<HistoryRecord> load_history();

  void save_queue(const std::vector<QueueItem>& items) const;
  void save_history(const std::vector<HistoryRecord>& records) const;

  std::filesystem::path queue_path() const { return data_dir_ / "queue.json"; }
  std::filesystem::path history_path() const { return data_dir_ / "history.json"; }

private:
  std::optional<nlohmann::json> read_document(const std::filesystem::path& path);
  void quarantine(const std::filesystem::path& path, const std::string& reason);
  void write_document(const std::filesystem::path& path, const nlohmann::json& doc) const;

  std::filesystem::path data_dir_;
  std::shared_ptr<Logger> logger_;
};
