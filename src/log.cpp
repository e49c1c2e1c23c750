#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <exception>
#include <memory>
#include <vector>

namespace {

std::mutex g_sinks_mutex;
std::shared_ptr<spdlog::logger> g_log;
std::shared_ptr<spdlog::logger> g_console_out;
std::shared_ptr<spdlog::logger> g_console_err;
bool g_file_attached = false;
std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_console(const char* name, spdlog::sink_ptr sink) {
  sink->set_pattern("%v");
  auto console = std::make_shared<spdlog::logger>(name, std::move(sink));
  console->flush_on(spdlog::level::info);
  return console;
}

void create_sinks_locked() {
  if(g_log) return;
  auto log_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  log_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  g_log = std::make_shared<spdlog::logger>("safemover", std::move(log_sink));
  g_log->set_level(spdlog::level::info);
  g_log->flush_on(spdlog::level::warn);

  g_console_out = make_console("safemover.out", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  g_console_err = make_console("safemover.err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
}

spdlog::logger& sinks(std::shared_ptr<spdlog::logger>& which) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  create_sinks_locked();
  return *which;
}

void emit(spdlog::level::level_enum level, const std::string& text) {
  if(!g_passthrough.load(std::memory_order_acquire)) return;
  sinks(g_log).log(level, text);
}

} // namespace

void init(const LogOptions& options) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  create_sinks_locked();
  if(!options.log_file.empty() && !g_file_attached) {
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      options.log_file, options.log_file_max_bytes, options.log_file_count);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    g_log->sinks().push_back(std::move(file_sink));
    g_file_attached = true;
  }
  g_log->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::write(spdlog::level::level_enum level, const std::string& message) {
  // Listeners run unlocked; they may add or remove listeners themselves.
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }
  bool consumed = false;
  for(const auto& listener : listeners) {
    try {
      consumed = listener(name_, level, message) || consumed;
    } catch(const std::exception& e) {
      emit(spdlog::level::err, "[" + name_ + "] log listener threw: " + e.what());
    }
  }
  if(!consumed) {
    emit(level, "[" + name_ + "] " + message);
  }
}

void write_log(Logger* logger, spdlog::level::level_enum level, const std::string& message) {
  if(logger) {
    logger->write(level, message);
  } else {
    emit(level, message);
  }
}

void print_line(bool to_stderr, const std::string& text) {
  sinks(to_stderr ? g_console_err : g_console_out).info(text);
}
