#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "operation_handler.hpp"
#include "queue_store.hpp"

class Logger;

// Persisted FIFO of media jobs drained by a single worker. One mutex guards
// every piece of queue state and every store write; it is the only lock on
// the job path.
class OperationQueue {
public:
  struct Options {
    std::size_t history_limit = 10;
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds progress_flush_interval{500};
  };

  OperationQueue(std::shared_ptr<QueueStore> store,
                 std::shared_ptr<const HandlerRegistry> handlers,
                 Options options,
                 std::shared_ptr<Logger> logger);
  ~OperationQueue();

  OperationQueue(const OperationQueue&) = delete;
  OperationQueue& operator=(const OperationQueue&) = delete;

  // PreconditionError for an unknown type or a subject already queued or running.
  QueueItem enqueue(const MediaSubject& subject, const std::string& operation_type);
  // PreconditionError when `item_id` is running. False when it is not queued.
  bool dequeue(const std::string& item_id);
  // Forgets every queued item, including the running one. Its handler keeps
  // going and still lands in history.
  std::size_t clear();

  std::vector<QueueItem> list_queue() const;
  std::vector<HistoryRecord> list_history() const;
  std::optional<std::string> current_item_id() const;

  // Runs the head job to completion on the calling thread. False if idle.
  bool process_next();

  void run();
  void start_background();
  void stop();

private:
  QueueItem* find_item_locked(const std::string& item_id);
  std::string make_item_id_locked(const MediaSubject& subject, const std::string& operation_type) const;
  void persist_queue_locked();
  void replace_queue_locked(std::vector<QueueItem> next);
  void update_status(const std::string& item_id, const std::string& status);
  void update_progress(const std::string& item_id, const std::string& progress);
  void finish(const std::string& item_id,
              const std::string& title,
              const std::string& operation_type,
              bool success,
              const std::string& error,
              const std::string& error_kind);
  void recover_locked();

  std::shared_ptr<QueueStore> store_;
  std::shared_ptr<const HandlerRegistry> handlers_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::vector<QueueItem> queue_;
  std::vector<HistoryRecord> history_;
  std::optional<std::string> current_id_;
  std::optional<std::int64_t> current_subject_id_;
  std::chrono::steady_clock::time_point last_progress_flush_{};

  std::atomic<bool> stop_requested_{false};
  std::thread worker_;
};
