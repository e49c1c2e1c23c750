#include "operation_queue.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

OperationQueue::OperationQueue(std::shared_ptr<QueueStore> store,
                               std::shared_ptr<const HandlerRegistry> handlers,
                               Options options,
                               std::shared_ptr<Logger> logger)
  : store_(std::move(store)),
    handlers_(std::move(handlers)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("queue")) {
  if(!store_ || !handlers_) {
    throw std::invalid_argument("OperationQueue needs a store and a handler registry");
  }
  if(options_.history_limit == 0) options_.history_limit = 1;
  if(options_.poll_interval.count() <= 0) options_.poll_interval = std::chrono::milliseconds(1000);

  std::lock_guard<std::mutex> lock(mutex_);
  queue_ = store_->load_queue();
  history_ = store_->load_history();
  if(history_.size() > options_.history_limit) {
    history_.resize(options_.history_limit);
  }
  recover_locked();
}

OperationQueue::~OperationQueue() {
  stop();
}

void OperationQueue::recover_locked() {
  std::size_t requeued = 0;
  for(auto& item : queue_) {
    if(item.state == ItemState::Pending) continue;
    item.state = ItemState::Pending;
    item.status.clear();
    item.progress = "Requeued after restart";
    item.started_at.clear();
    ++requeued;
  }
  if(requeued > 0) {
    logger_->warn("Requeued {} interrupted job(s) after restart", requeued);
    persist_queue_locked();
  }
  if(!queue_.empty()) {
    logger_->info("Loaded {} queued job(s)", queue_.size());
  }
}

QueueItem* OperationQueue::find_item_locked(const std::string& item_id) {
  auto it = std::find_if(queue_.begin(), queue_.end(),
                         [&](const QueueItem& item){ return item.id == item_id; });
  return it == queue_.end() ? nullptr : &*it;
}

std::string OperationQueue::make_item_id_locked(const MediaSubject& subject,
                                                const std::string& operation_type) const {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  std::string base = std::to_string(subject.id) + "_" + operation_type + "_" + std::to_string(micros);
  std::string id = base;
  auto taken = [&](const std::string& candidate) {
    return std::any_of(queue_.begin(), queue_.end(),
                       [&](const QueueItem& item){ return item.id == candidate; });
  };
  for(int n = 1; taken(id); ++n) {
    id = base + "_" + std::to_string(n);
  }
  return id;
}

void OperationQueue::persist_queue_locked() {
  store_->save_queue(queue_);
  last_progress_flush_ = std::chrono::steady_clock::now();
}

// queue.json is written before `next` is adopted, so a failed write leaves
// memory and disk agreeing on the old queue.
void OperationQueue::replace_queue_locked(std::vector<QueueItem> next) {
  store_->save_queue(next);
  queue_ = std::move(next);
  last_progress_flush_ = std::chrono::steady_clock::now();
}

QueueItem OperationQueue::enqueue(const MediaSubject& subject, const std::string& operation_type) {
  if(!handlers_->contains(operation_type)) {
    std::string known;
    for(const auto& type : handlers_->types()) {
      if(!known.empty()) known += ", ";
      known += type;
    }
    throw PreconditionError("Unknown operation type '" + operation_type + "' (known: " + known + ")");
  }
  QueueItem item;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    bool duplicate = (current_subject_id_ && *current_subject_id_ == subject.id) ||
      std::any_of(queue_.begin(), queue_.end(),
                  [&](const QueueItem& queued){ return queued.subject.id == subject.id; });
    if(duplicate) {
      throw PreconditionError("'" + subject.title + "' (id " + std::to_string(subject.id) +
                              ") is already in the queue");
    }
    item.id = make_item_id_locked(subject, operation_type);
    item.subject = subject;
    item.operation_type = operation_type;
    item.state = ItemState::Pending;
    item.progress = "Waiting in queue...";
    item.added_at = iso8601_now();
    auto next = queue_;
    next.push_back(item);
    replace_queue_locked(std::move(next));
  }
  logger_->info("Queued {} of '{}' as {}", operation_type, subject.title, item.id);
  wake_.notify_all();
  return item;
}

bool OperationQueue::dequeue(const std::string& item_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(current_id_ && *current_id_ == item_id) {
    throw PreconditionError("Cannot remove " + item_id + ": it is currently being processed");
  }
  auto* item = find_item_locked(item_id);
  if(!item) return false;
  std::string title = item->subject.title;
  std::vector<QueueItem> next;
  next.reserve(queue_.size());
  std::copy_if(queue_.begin(), queue_.end(), std::back_inserter(next),
               [&](const QueueItem& queued){ return queued.id != item_id; });
  replace_queue_locked(std::move(next));
  logger_->info("Removed {} ('{}') from the queue", item_id, title);
  return true;
}

std::size_t OperationQueue::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto count = queue_.size();
  replace_queue_locked({});
  if(current_id_) {
    logger_->warn("Queue cleared while {} is running; its process is not cancelled", *current_id_);
  }
  logger_->warn("Queue forcefully cleared. Removed {} item(s)", count);
  return count;
}

std::vector<QueueItem> OperationQueue::list_queue() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_;
}

std::vector<HistoryRecord> OperationQueue::list_history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_;
}

std::optional<std::string> OperationQueue::current_item_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_id_;
}

void OperationQueue::update_status(const std::string& item_id, const std::string& status) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* item = find_item_locked(item_id);
  if(!item) return;
  item->status = status;
  persist_queue_locked();
  logger_->debug("{} -> {}", item_id, status);
}

void OperationQueue::update_progress(const std::string& item_id, const std::string& progress) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* item = find_item_locked(item_id);
  if(!item) return;
  item->progress = progress;
  auto now = std::chrono::steady_clock::now();
  if(now - last_progress_flush_ >= options_.progress_flush_interval) {
    persist_queue_locked();
  }
}

void OperationQueue::finish(const std::string& item_id,
                            const std::string& title,
                            const std::string& operation_type,
                            bool success,
                            const std::string& error,
                            const std::string& error_kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  const ItemState final_state = success ? ItemState::Completed : ItemState::Failed;
  logger_->debug("{} -> {}", item_id, to_string(final_state));
  if(auto* item = find_item_locked(item_id)) {
    item->state = final_state;
    if(success) {
      item->progress = "Completed successfully";
      item->completed_at = iso8601_now();
    } else {
      item->progress = "Error: " + error;
      item->failed_at = iso8601_now();
    }
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                [&](const QueueItem& queued){ return queued.id == item_id; }),
                 queue_.end());
  } else {
    logger_->warn("{} was cleared while running; recording its outcome anyway", item_id);
  }

  HistoryRecord record;
  record.title = title;
  record.operation_type = operation_type;
  record.success = success;
  record.timestamp = iso8601_now();
  if(!success) {
    record.error = error;
    record.error_kind = error_kind;
  }
  history_.insert(history_.begin(), std::move(record));
  if(history_.size() > options_.history_limit) {
    history_.resize(options_.history_limit);
  }

  current_id_.reset();
  current_subject_id_.reset();

  try {
    persist_queue_locked();
    store_->save_history(history_);
  } catch(const std::exception& e) {
    logger_->error("Unable to persist outcome of {}: {}", item_id, e.what());
  }
  logger_->info("{} '{}' {}. Remaining: {}", operation_type, title,
                success ? "completed" : "failed", queue_.size());
}

bool OperationQueue::process_next() {
  std::string item_id;
  std::string operation_type;
  MediaSubject subject;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(current_id_ || queue_.empty()) return false;
    auto& head = queue_.front();
    head.state = ItemState::Processing;
    head.status.clear();
    head.started_at = iso8601_now();
    current_id_ = head.id;
    current_subject_id_ = head.subject.id;
    item_id = head.id;
    operation_type = head.operation_type;
    subject = head.subject;
    logger_->debug("{} -> {}", item_id, to_string(ItemState::Processing));
    try {
      persist_queue_locked();
    } catch(const std::exception& e) {
      logger_->error("Unable to persist start of {}: {}", item_id, e.what());
    }
  }

  logger_->info("Processing {} of '{}' ({})", operation_type, subject.title, item_id);
  bool success = false;
  std::string error;
  std::string error_kind;
  try {
    auto handler = handlers_->find(operation_type);
    if(!handler) {
      throw PreconditionError("No handler registered for operation type '" + operation_type + "'");
    }
    handler->execute(subject,
                     [this, &item_id](const std::string& status){ update_status(item_id, status); },
                     [this, &item_id](const std::string& progress){ update_progress(item_id, progress); });
    success = true;
  } catch(const MoverError& e) {
    error = e.what();
    error_kind = to_string(e.kind());
    logger_->error("{} of '{}' failed ({}): {}", operation_type, subject.title, error_kind, error);
  } catch(const std::exception& e) {
    error = e.what();
    error_kind = to_string(ErrorKind::Internal);
    logger_->error("{} of '{}' failed: {}", operation_type, subject.title, error);
  }
  if(!success && error.empty()) {
    error = "unknown error";
  }

  finish(item_id, subject.title, operation_type, success, error, error_kind);
  return true;
}

void OperationQueue::run() {
  logger_->info("Queue worker started");
  while(!stop_requested_.load()) {
    if(process_next()) continue;
    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, options_.poll_interval, [&]{
      return stop_requested_.load() || (!queue_.empty() && !current_id_);
    });
  }
  logger_->info("Queue worker stopped");
}

void OperationQueue::start_background() {
  if(worker_.joinable()) return;
  stop_requested_.store(false);
  worker_ = std::thread([this]{ run(); });
}

void OperationQueue::stop() {
  stop_requested_.store(true);
  wake_.notify_all();
  if(worker_.joinable()) {
    if(current_item_id()) {
      logger_->info("Waiting for the running job to finish before stopping");
    }
    worker_.join();
  }
}
