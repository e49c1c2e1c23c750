#include "errors.hpp"
#include "log.hpp"
#include "mover_cli.hpp"
#include "mover_service.hpp"
#include "operation_handler.hpp"
#include "operation_queue.hpp"
#include "queue_store.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace safemover::test;
using namespace std::chrono_literals;

namespace {

// Records the subjects it runs; optionally parks inside execute until released.
class ScriptedHandler : public OperationHandler {
public:
  void execute(const MediaSubject& subject,
               const StatusCallback& update_status,
               const ProgressCallback& update_progress) override {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      executed_.push_back(subject.id);
      entered_ = true;
      cv_.notify_all();
      cv_.wait(lock, [&]{ return !hold_; });
    }
    update_status("working");
    update_progress("half way");
    if(subject.title.find("corrupt") != std::string::npos) {
      throw CorruptionError("checksum mismatch in test");
    }
    if(subject.title.find("broken") != std::string::npos) {
      throw std::runtime_error("plain failure");
    }
  }

  void hold() {
    std::lock_guard<std::mutex> lock(mutex_);
    hold_ = true;
    entered_ = false;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    hold_ = false;
    cv_.notify_all();
  }

  bool wait_entered(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]{ return entered_; });
  }

  std::vector<std::int64_t> executed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return executed_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool hold_ = false;
  bool entered_ = false;
  std::vector<std::int64_t> executed_;
};

struct QueueFixture {
  QueueFixture(TestContext& ctx, const std::string& name, std::size_t history_limit = 10)
    : ws(name),
      logger(std::make_shared<Logger>("queue-test")),
      handler(std::make_shared<ScriptedHandler>()),
      handlers(std::make_shared<const HandlerRegistry>(HandlerRegistry::Map{
        {"copy", handler},
        {"convert", handler}
      })) {
    ctx.logs.attach(logger);
    options.history_limit = history_limit;
    options.poll_interval = 20ms;
    options.progress_flush_interval = 0ms;
  }

  std::shared_ptr<OperationQueue> make_queue() {
    auto store = std::make_shared<QueueStore>(ws / "data", logger);
    return std::make_shared<OperationQueue>(store, handlers, options, logger);
  }

  TempWorkspace ws;
  std::shared_ptr<Logger> logger;
  std::shared_ptr<ScriptedHandler> handler;
  std::shared_ptr<const HandlerRegistry> handlers;
  OperationQueue::Options options;
};

MediaSubject subject(std::int64_t id, const std::string& title) {
  MediaSubject s;
  s.id = id;
  s.title = title;
  s.location = "/fast/" + title + "/" + title + ".mkv";
  return s;
}

bool test_enqueue_rejects_duplicates_and_unknown_types(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_duplicates");
  auto queue = fx.make_queue();
  auto item = queue->enqueue(subject(42, "Movie A"), "copy");
  if(item.state != ItemState::Pending || !item.status.empty() || item.progress != "Waiting in queue...") return false;

  bool duplicate_rejected = false;
  try {
    queue->enqueue(subject(42, "Movie A"), "convert");
  } catch(const PreconditionError&) {
    duplicate_rejected = true;
  }
  bool unknown_rejected = false;
  try {
    queue->enqueue(subject(43, "Movie B"), "shred");
  } catch(const PreconditionError& e) {
    unknown_rejected = std::string(e.what()).find("(known: convert, copy)") != std::string::npos;
  }

  queue->process_next();
  queue->enqueue(subject(42, "Movie A"), "convert");
  return duplicate_rejected && unknown_rejected && queue->list_queue().size() == 1;
}

bool test_duplicate_rejected_while_processing(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_duplicate_running");
  auto queue = fx.make_queue();
  queue->enqueue(subject(1, "Running"), "copy");
  fx.handler->hold();
  std::thread worker([&]{ queue->process_next(); });
  bool entered = fx.handler->wait_entered(2s);

  bool rejected = false;
  try {
    queue->enqueue(subject(1, "Running"), "copy");
  } catch(const PreconditionError&) {
    rejected = true;
  }
  fx.handler->release();
  worker.join();
  return entered && rejected;
}

bool test_fifo_order(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_fifo");
  auto queue = fx.make_queue();
  for(std::int64_t id : {5, 3, 9, 1}) {
    queue->enqueue(subject(id, "Movie " + std::to_string(id)), "copy");
  }
  while(queue->process_next()) {}
  return fx.handler->executed() == std::vector<std::int64_t>{5, 3, 9, 1} &&
         queue->list_queue().empty();
}

bool test_dequeue_pending_and_refuse_running(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_dequeue");
  auto queue = fx.make_queue();
  auto running = queue->enqueue(subject(1, "First"), "copy");
  auto waiting = queue->enqueue(subject(2, "Second"), "copy");

  fx.handler->hold();
  std::thread worker([&]{ queue->process_next(); });
  bool entered = fx.handler->wait_entered(2s);

  bool refused = false;
  try {
    queue->dequeue(running.id);
  } catch(const PreconditionError&) {
    refused = true;
  }
  bool removed = queue->dequeue(waiting.id);
  bool missing = !queue->dequeue("no-such-item");
  fx.handler->release();
  worker.join();

  return entered && refused && removed && missing &&
         queue->list_queue().empty() &&
         fx.handler->executed() == std::vector<std::int64_t>{1};
}

bool test_history_bounded_most_recent_first(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_history", 3);
  auto queue = fx.make_queue();
  for(int i = 1; i <= 5; ++i) {
    queue->enqueue(subject(i, "Movie " + std::to_string(i)), "copy");
    queue->process_next();
  }
  auto history = queue->list_history();
  auto reloaded = QueueStore(fx.ws / "data", fx.logger).load_history();
  return history.size() == 3 && history[0].title == "Movie 5" && history[2].title == "Movie 3" &&
         reloaded.size() == 3 && reloaded[0].title == "Movie 5";
}

bool test_failures_are_recorded_with_kind(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_failures");
  auto queue = fx.make_queue();
  queue->enqueue(subject(1, "corrupt one"), "copy");
  queue->enqueue(subject(2, "broken two"), "convert");
  queue->enqueue(subject(3, "fine three"), "copy");
  while(queue->process_next()) {}

  auto history = queue->list_history();
  if(history.size() != 3) return false;
  const auto& ok = history[0];
  const auto& internal = history[1];
  const auto& corrupt = history[2];
  return ok.success && !ok.error && ok.error_kind.empty() &&
         !internal.success && internal.error && *internal.error == "plain failure" &&
         internal.error_kind == "internal" && internal.operation_type == "convert" &&
         !corrupt.success && corrupt.error_kind == "corruption" &&
         corrupt.error->rfind("Corruption detected", 0) == 0 &&
         queue->list_queue().empty();
}

bool test_status_transitions_are_logged(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_transitions");
  auto queue = fx.make_queue();
  auto item = queue->enqueue(subject(8, "Traced"), "copy");
  queue->process_next();
  return ctx.logs.contains(item.id + " -> processing") &&
         ctx.logs.contains(item.id + " -> working") &&
         ctx.logs.contains(item.id + " -> completed");
}

bool test_queue_survives_restart(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_restart");
  std::string first_id;
  {
    auto queue = fx.make_queue();
    first_id = queue->enqueue(subject(1, "One"), "copy").id;
    queue->enqueue(subject(2, "Two"), "convert");
  }
  auto queue = fx.make_queue();
  auto items = queue->list_queue();
  return items.size() == 2 && items[0].id == first_id &&
         items[1].operation_type == "convert" && items[1].subject.title == "Two";
}

bool test_interrupted_items_are_requeued(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_recovery");
  QueueItem interrupted;
  interrupted.id = "4_copy_1";
  interrupted.subject = subject(4, "Interrupted");
  interrupted.operation_type = "copy";
  interrupted.state = ItemState::Processing;
  interrupted.status = "copying";
  interrupted.progress = "Copying: 40% (4.0/10.0 MiB)";
  interrupted.added_at = "2024-01-01T00:00:00";
  interrupted.started_at = "2024-01-01T00:00:05";
  {
    QueueStore store(fx.ws / "data", fx.logger);
    store.save_queue({interrupted});
  }
  auto queue = fx.make_queue();
  auto items = queue->list_queue();
  if(items.size() != 1 || items[0].state != ItemState::Pending || !items[0].status.empty() ||
     items[0].progress != "Requeued after restart" || !items[0].started_at.empty()) {
    return false;
  }
  auto persisted = QueueStore(fx.ws / "data", fx.logger).load_queue();
  if(persisted.size() != 1 || persisted[0].state != ItemState::Pending) return false;
  queue->process_next();
  return fx.handler->executed() == std::vector<std::int64_t>{4};
}

bool test_corrupt_queue_file_is_quarantined(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_corrupt");
  write_file(fx.ws / "data/queue.json", "{ not json");
  write_file(fx.ws / "data/history.json", R"({"an":"object"})");
  auto queue = fx.make_queue();
  return queue->list_queue().empty() && queue->list_history().empty() &&
         fs::exists(fx.ws / "data/queue.json.corrupt") &&
         fs::exists(fx.ws / "data/history.json.corrupt") &&
         ctx.logs.contains("queue.json");
}

bool test_clear_while_running_still_records_outcome(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_clear");
  auto queue = fx.make_queue();
  auto running = queue->enqueue(subject(1, "Running"), "copy");
  queue->enqueue(subject(2, "Waiting"), "copy");
  fx.handler->hold();
  std::thread worker([&]{ queue->process_next(); });
  bool entered = fx.handler->wait_entered(2s);

  auto removed = queue->clear();
  bool still_busy = queue->current_item_id() && *queue->current_item_id() == running.id;
  bool duplicate_rejected = false;
  try {
    queue->enqueue(subject(1, "Running"), "copy");
  } catch(const PreconditionError&) {
    duplicate_rejected = true;
  }
  fx.handler->release();
  worker.join();

  auto history = queue->list_history();
  return entered && removed == 2 && still_busy && duplicate_rejected &&
         queue->list_queue().empty() && !queue->current_item_id() &&
         history.size() == 1 && history[0].title == "Running" && history[0].success;
}

bool test_unknown_item_state_quarantines_queue(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_unknown_state");
  nlohmann::json item = queue_item_to_json(QueueItem{});
  item["id"] = "1_copy_1";
  item["subject"] = subject_to_json(subject(1, "Odd"));
  item["operation_type"] = "copy";
  item["state"] = "copying";
  write_file(fx.ws / "data/queue.json", nlohmann::json::array({item}).dump());
  auto queue = fx.make_queue();
  return queue->list_queue().empty() && fs::exists(fx.ws / "data/queue.json.corrupt") &&
         ctx.logs.contains("unknown state");
}

// A directory where the temporary queue file goes makes every queue write fail.
void break_queue_writes(const QueueFixture& fx) {
  fs::create_directories(fx.ws / "data/queue.json.tmp");
}

bool test_failed_writes_leave_queue_unchanged(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_dequeue_write_failure");
  auto queue = fx.make_queue();
  auto first = queue->enqueue(subject(1, "First"), "copy");
  queue->enqueue(subject(2, "Second"), "copy");
  break_queue_writes(fx);

  bool threw = false;
  try {
    queue->dequeue(first.id);
  } catch(const std::exception&) {
    threw = true;
  }
  bool cleared_threw = false;
  try {
    queue->clear();
  } catch(const std::exception&) {
    cleared_threw = true;
  }
  bool enqueue_threw = false;
  try {
    queue->enqueue(subject(3, "Third"), "copy");
  } catch(const std::exception&) {
    enqueue_threw = true;
  }

  auto items = queue->list_queue();
  auto persisted = QueueStore(fx.ws / "data", fx.logger).load_queue();
  return threw && cleared_threw && enqueue_threw &&
         items.size() == 2 && items[0].id == first.id &&
         persisted.size() == 2 && persisted[0].id == first.id;
}

bool test_console_survives_failed_command(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_console_write_failure");
  auto queue = fx.make_queue();
  auto item = queue->enqueue(subject(1, "First"), "copy");
  break_queue_writes(fx);

  auto settings = std::make_shared<SettingsManager>();
  std::ostringstream out;
  MoverCLI cli(queue, std::make_shared<FakeCatalogClient>(), settings, out);
  bool kept_running = cli.execute("remove " + item.id) && cli.execute("clear");
  bool quit = !cli.execute("quit");
  return kept_running && quit &&
         out.str().find("Error: remove failed") != std::string::npos &&
         out.str().find("Error: clear failed") != std::string::npos &&
         queue->list_queue().size() == 1;
}

bool test_background_worker_drains_queue(TestContext& ctx) {
  QueueFixture fx(ctx, "queue_background");
  auto queue = fx.make_queue();
  queue->start_background();
  queue->enqueue(subject(1, "One"), "copy");
  queue->enqueue(subject(2, "Two"), "copy");
  bool drained = wait_for_condition([&]{ return queue->list_history().size() == 2; }, 5s);
  queue->stop();
  return drained && queue->list_queue().empty() &&
         fx.handler->executed() == std::vector<std::int64_t>{1, 2};
}

// --- end to end through the service --------------------------------------

std::shared_ptr<SettingsManager> service_settings(const TempWorkspace& ws,
                                                  const fs::path& fast_root,
                                                  const fs::path& slow_root) {
  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(ws / ".config/settings.json");
  auto configure = [&](const std::string& key, const nlohmann::json& value){
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  configure("fast_root", fast_root.string());
  configure("slow_root", slow_root.string());
  configure("poll_interval_ms", 20);
  configure("digest_block_size", 4096);
  configure("temp_dir", (ws / "tmp").string());
  return settings;
}

bool test_service_copy_scenario(TestContext& ctx) {
  TempWorkspace ws("service_copy");
  auto payload = make_payload(64 * 1024);
  write_file(ws / "fast/Movie A/Movie.A.2019.mkv", payload);

  auto catalog = std::make_shared<FakeCatalogClient>();
  MoverService::Options options;
  options.workspace_root = ws.root();
  options.catalog = catalog;
  MoverService service(service_settings(ws, ws / "fast", ws / "slow"), options);
  ctx.logs.attach(service);
  service.start();

  nlohmann::json doc = {{"id", 42}, {"title", "Movie A"}, {"location", (ws / "fast/Movie A").string()}};
  service.execute_command("enqueue copy " + doc.dump());
  auto queue = service.queue();
  bool finished = wait_for_condition([&]{ return queue->list_history().size() == 1; }, 10s);
  service.stop();

  auto history = queue->list_history();
  auto dst = ws / "slow/Movie A/Movie.A.2019.mkv";
  bool transitions = ctx.logs.contains("-> processing") && ctx.logs.contains("-> copying") &&
                     ctx.logs.contains("-> updating") && ctx.logs.contains("-> completed");
  return finished && history.size() == 1 && history[0].success &&
         history[0].title == "Movie A" && history[0].operation_type == "copy" &&
         queue->list_queue().empty() && fs::exists(dst) && read_file(dst) == payload &&
         transitions && catalog->updates.size() == 1 &&
         fs::exists(ws / "data/history.json");
}

bool test_service_copy_to_unwritable_tier_fails(TestContext& ctx) {
  TempWorkspace ws("service_copy_unwritable");
  auto payload = make_payload(8 * 1024);
  write_file(ws / "fast/Movie A/movie.mkv", payload);
  // A plain file where the slow tier directory should be makes every write fail.
  write_file(ws / "slow", "not a directory");

  auto catalog = std::make_shared<FakeCatalogClient>();
  MoverService::Options options;
  options.workspace_root = ws.root();
  options.catalog = catalog;
  MoverService service(service_settings(ws, ws / "fast", ws / "slow"), options);
  ctx.logs.attach(service);
  service.start();

  nlohmann::json doc = {{"id", 42}, {"title", "Movie A"}, {"location", (ws / "fast/Movie A/movie.mkv").string()}};
  service.execute_command("enqueue copy " + doc.dump());
  auto queue = service.queue();
  bool finished = wait_for_condition([&]{ return queue->list_history().size() == 1; }, 10s);
  service.stop();

  auto history = queue->list_history();
  return finished && history.size() == 1 && !history[0].success &&
         history[0].error && !history[0].error->empty() &&
         queue->list_queue().empty() &&
         read_file(ws / "fast/Movie A/movie.mkv") == payload &&
         catalog->updates.empty();
}

bool test_service_console_uses_catalog(TestContext& ctx) {
  TempWorkspace ws("service_console");
  auto catalog = std::make_shared<FakeCatalogClient>();
  MediaSubject known;
  known.id = 11;
  known.title = "Known";
  known.location = ws / "fast/Known/known.mkv";
  catalog->add_subject(known);

  MoverService::Options options;
  options.workspace_root = ws.root();
  options.catalog = catalog;
  MoverService service(service_settings(ws, ws / "fast", ws / "slow"), options);
  ctx.logs.attach(service);
  service.start();

  // 11 is known but its file is missing, so the job fails at the precondition check.
  service.execute_command("copy 11");
  service.execute_command("copy 12");
  auto queue = service.queue();
  bool finished = wait_for_condition([&]{ return queue->list_history().size() == 1; }, 10s);
  service.stop();

  auto history = queue->list_history();
  return finished && ctx.logs.contains("Queued copy of 'Known'") &&
         history.size() == 1 && history[0].title == "Known" && !history[0].success &&
         history[0].error_kind == "precondition" && queue->list_queue().empty();
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"enqueue_rejects_duplicates_and_unknown_types", test_enqueue_rejects_duplicates_and_unknown_types},
    {"duplicate_rejected_while_processing", test_duplicate_rejected_while_processing},
    {"fifo_order", test_fifo_order},
    {"dequeue_pending_and_refuse_running", test_dequeue_pending_and_refuse_running},
    {"history_bounded_most_recent_first", test_history_bounded_most_recent_first},
    {"failures_are_recorded_with_kind", test_failures_are_recorded_with_kind},
    {"status_transitions_are_logged", test_status_transitions_are_logged},
    {"queue_survives_restart", test_queue_survives_restart},
    {"interrupted_items_are_requeued", test_interrupted_items_are_requeued},
    {"corrupt_queue_file_is_quarantined", test_corrupt_queue_file_is_quarantined},
    {"clear_while_running_still_records_outcome", test_clear_while_running_still_records_outcome},
    {"unknown_item_state_quarantines_queue", test_unknown_item_state_quarantines_queue},
    {"failed_writes_leave_queue_unchanged", test_failed_writes_leave_queue_unchanged},
    {"console_survives_failed_command", test_console_survives_failed_command},
    {"background_worker_drains_queue", test_background_worker_drains_queue},
    {"service_copy_scenario", test_service_copy_scenario},
    {"service_copy_to_unwritable_tier_fails", test_service_copy_to_unwritable_tier_fails},
    {"service_console_uses_catalog", test_service_console_uses_catalog}
  };
  return run_suite("queue", tests, argc, argv);
}
