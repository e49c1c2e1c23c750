#include "queue_store.hpp"

#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "log.hpp"

namespace fs = std::filesystem;

namespace {

void put_optional(nlohmann::json& doc, const char* key, const std::string& value) {
  if(!value.empty()) doc[key] = value;
}

std::string get_string(const nlohmann::json& doc, const char* key) {
  if(doc.contains(key) && doc.at(key).is_string()) return doc.at(key).get<std::string>();
  return {};
}

} // namespace

const char* to_string(ItemState state) {
  switch(state) {
    case ItemState::Pending: return "pending";
    case ItemState::Processing: return "processing";
    case ItemState::Completed: return "completed";
    case ItemState::Failed: return "failed";
  }
  return "pending";
}

std::optional<ItemState> item_state_from_string(const std::string& text) {
  for(auto state : {ItemState::Pending, ItemState::Processing, ItemState::Completed, ItemState::Failed}) {
    if(text == to_string(state)) return state;
  }
  return std::nullopt;
}

nlohmann::json queue_item_to_json(const QueueItem& item) {
  nlohmann::json doc = {
    {"id", item.id},
    {"subject", subject_to_json(item.subject)},
    {"operation_type", item.operation_type},
    {"state", to_string(item.state)},
    {"status", item.status},
    {"progress", item.progress},
    {"added_at", item.added_at}
  };
  put_optional(doc, "started_at", item.started_at);
  put_optional(doc, "completed_at", item.completed_at);
  put_optional(doc, "failed_at", item.failed_at);
  return doc;
}

QueueItem queue_item_from_json(const nlohmann::json& doc) {
  QueueItem item;
  item.id = doc.at("id").get<std::string>();
  item.subject = subject_from_json(doc.at("subject"));
  item.operation_type = doc.at("operation_type").get<std::string>();
  auto state_text = get_string(doc, "state");
  if(!state_text.empty()) {
    auto state = item_state_from_string(state_text);
    if(!state) {
      throw std::runtime_error("queue item " + item.id + " has unknown state '" + state_text + "'");
    }
    item.state = *state;
  }
  item.status = get_string(doc, "status");
  item.progress = get_string(doc, "progress");
  item.added_at = get_string(doc, "added_at");
  item.started_at = get_string(doc, "started_at");
  item.completed_at = get_string(doc, "completed_at");
  item.failed_at = get_string(doc, "failed_at");
  return item;
}

nlohmann::json history_record_to_json(const HistoryRecord& record) {
  nlohmann::json doc = {
    {"title", record.title},
    {"operation_type", record.operation_type},
    {"success", record.success},
    {"timestamp", record.timestamp},
    {"error", record.error ? nlohmann::json(*record.error) : nlohmann::json(nullptr)}
  };
  if(!record.error_kind.empty()) doc["error_kind"] = record.error_kind;
  return doc;
}

HistoryRecord history_record_from_json(const nlohmann::json& doc) {
  HistoryRecord record;
  record.title = doc.at("title").get<std::string>();
  record.operation_type = get_string(doc, "operation_type");
  record.success = doc.value("success", false);
  record.timestamp = get_string(doc, "timestamp");
  if(doc.contains("error") && doc.at("error").is_string()) {
    record.error = doc.at("error").get<std::string>();
  }
  record.error_kind = get_string(doc, "error_kind");
  return record;
}

QueueStore::QueueStore(fs::path data_dir, std::shared_ptr<Logger> logger)
  : data_dir_(std::move(data_dir)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("queue-store")) {
  fs::create_directories(data_dir_);
}

void QueueStore::quarantine(const fs::path& path, const std::string& reason) {
  fs::path aside = path;
  aside += ".corrupt";
  std::error_code ec;
  fs::rename(path, aside, ec);
  if(ec) {
    logger_->error("{} is unreadable ({}) and could not be moved aside: {}",
                   path.string(), reason, ec.message());
  } else {
    logger_->error("{} is unreadable ({}); moved to {} and starting empty",
                   path.string(), reason, aside.string());
  }
}

std::optional<nlohmann::json> QueueStore::read_document(const fs::path& path) {
  std::ifstream in(path);
  if(!in) return std::nullopt;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::parse_error& e) {
    quarantine(path, e.what());
    return std::nullopt;
  }
  if(!doc.is_array()) {
    quarantine(path, "expected a JSON array");
    return std::nullopt;
  }
  return doc;
}

std::vector<QueueItem> QueueStore::load_queue() {
  std::vector<QueueItem> items;
  auto doc = read_document(queue_path());
  if(!doc) return items;
  try {
    for(const auto& entry : *doc) {
      items.push_back(queue_item_from_json(entry));
    }
  } catch(const std::exception& e) {
    quarantine(queue_path(), e.what());
    items.clear();
  }
  return items;
}

std::vector<HistoryRecord> QueueStore::load_history() {
  std::vector<HistoryRecord> records;
  auto doc = read_document(history_path());
  if(!doc) return records;
  try {
    for(const auto& entry : *doc) {
      records.push_back(history_record_from_json(entry));
    }
  } catch(const nlohmann::json::exception& e) {
    quarantine(history_path(), e.what());
    records.clear();
  }
  return records;
}

void QueueStore::write_document(const fs::path& path, const nlohmann::json& doc) const {
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      throw std::system_error(errno, std::generic_category(), "open " + tmp.string());
    }
    out << doc.dump(2);
    out.flush();
    if(!out) {
      throw std::system_error(errno, std::generic_category(), "write " + tmp.string());
    }
  }
  fs::rename(tmp, path);
}

void QueueStore::save_queue(const std::vector<QueueItem>& items) const {
  nlohmann::json doc = nlohmann::json::array();
  for(const auto& item : items) doc.push_back(queue_item_to_json(item));
  write_document(queue_path(), doc);
}

void QueueStore::save_history(const std::vector<HistoryRecord>& records) const {
  nlohmann::json doc = nlohmann::json::array();
  for(const auto& record : records) doc.push_back(history_record_to_json(record));
  write_document(history_path(), doc);
}
