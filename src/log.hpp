#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

struct LogOptions {
  bool verbose = false;
  std::string log_file;               // empty = console only
  std::size_t log_file_max_bytes = 10 * 1024 * 1024;
  std::size_t log_file_count = 3;
};

// Log lines are timestamped on stderr (plus the rotating file when set), so
// they never interleave with console replies on stdout. Calling init again
// only adjusts the level.
void init(const LogOptions& options = LogOptions{});
// Test runners turn the log stream off and read lines through listeners.
void set_log_passthrough(bool enabled);

using LogListenerHandle = std::size_t;

// One component's log channel. Listeners see every line, debug included;
// unless one of them returns true the line goes on to the log stream as
// "[name] message".
class Logger {
public:
  using Listener = std::function<bool(const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> format, Args&&... args) {
    write(spdlog::level::debug, fmt::format(format, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> format, Args&&... args) {
    write(spdlog::level::info, fmt::format(format, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> format, Args&&... args) {
    write(spdlog::level::warn, fmt::format(format, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> format, Args&&... args) {
    write(spdlog::level::err, fmt::format(format, std::forward<Args>(args)...));
  }

  void write(spdlog::level::level_enum level, const std::string& message);

private:
  std::string name_;
  std::mutex listener_mutex_;
  std::map<LogListenerHandle, Listener> listeners_;
  LogListenerHandle next_listener_id_ = 1;
};

// For helpers handed an optional logger: a null logger writes straight to the
// log stream.
void write_log(Logger* logger, spdlog::level::level_enum level, const std::string& message);

template<typename... Args>
void log_debug(Logger* logger, spdlog::format_string_t<Args...> format, Args&&... args) {
  write_log(logger, spdlog::level::debug, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void log_info(Logger* logger, spdlog::format_string_t<Args...> format, Args&&... args) {
  write_log(logger, spdlog::level::info, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void log_warn(Logger* logger, spdlog::format_string_t<Args...> format, Args&&... args) {
  write_log(logger, spdlog::level::warn, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void log_error(Logger* logger, spdlog::format_string_t<Args...> format, Args&&... args) {
  write_log(logger, spdlog::level::err, fmt::format(format, std::forward<Args>(args)...));
}

// Operator-facing text (usage, settings file problems): untimestamped and
// never suppressed.
void print_line(bool to_stderr, const std::string& text);

template<typename... Args>
void print_out(spdlog::format_string_t<Args...> format, Args&&... args) {
  print_line(false, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void print_err(spdlog::format_string_t<Args...> format, Args&&... args) {
  print_line(true, fmt::format(format, std::forward<Args>(args)...));
}
