#pragma once
#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <readline/readline.h>
#include <readline/history.h>

#include <nlohmann/json.hpp>

#include "catalog_client.hpp"
#include "errors.hpp"
#include "media_subject.hpp"
#include "operation_queue.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

class MoverCLI {
public:
  MoverCLI(std::shared_ptr<OperationQueue> queue,
           std::shared_ptr<CatalogClient> catalog,
           std::shared_ptr<SettingsManager> settings,
           std::ostream& out = std::cout)
    : queue_(std::move(queue)), catalog_(std::move(catalog)),
      settings_(std::move(settings)), out_(out), running_(true) {}

  void run_loop() {
    out_ << "safemover console. Type 'help' for commands.\n";
    while(running_) {
      auto input = read_command_line("> ");
      if(!input) break;
      if(!execute(*input)) break;
    }
  }

  // False once the operator asked to quit.
  bool execute(const std::string& input) {
    std::istringstream iss(input);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return true;

    std::string args;
    std::getline(iss, args);
    args = trim(args);

    // A failed command never ends the console; the worker keeps running.
    bool keep_going = true;
    try {
      keep_going = dispatch(cmd, args);
    } catch(const std::exception& e) {
      out_ << "Error: " << cmd << " failed: " << e.what() << "\n";
    }
    out_.flush();
    return keep_going;
  }

private:
  bool dispatch(const std::string& cmd, const std::string& args) {
    if(cmd == "queue" || cmd == "q") {
      print_queue();
    } else if(cmd == "history" || cmd == "hist") {
      print_history();
    } else if(cmd == "copy" || cmd == "convert") {
      enqueue_from_catalog(cmd, args);
    } else if(cmd == "enqueue") {
      enqueue_inline(args);
    } else if(cmd == "remove" || cmd == "rm") {
      remove_item(args);
    } else if(cmd == "clear") {
      auto removed = queue_->clear();
      out_ << "Cleared " << removed << " item(s) from the queue.\n";
    } else if(cmd == "settings" || cmd == "s") {
      handle_settings_command(args.empty() ? "list" : args);
    } else if(cmd == "set") {
      handle_settings_command(args.empty() ? "list" : "set " + args);
    } else if(cmd == "get") {
      handle_settings_command(args.empty() ? "get" : "get " + args);
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit") {
      out_ << "Quitting...\n";
      running_ = false;
      return false;
    } else {
      print_help();
      out_ << "Unknown command: " << cmd << "\n";
    }
    return true;
  }

  std::optional<std::string> read_command_line(const char* prompt) {
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
  }

  void print_queue() {
    auto items = queue_->list_queue();
    if(items.empty()) {
      out_ << "Queue is empty.\n";
      return;
    }
    auto current = queue_->current_item_id();
    for(const auto& item : items) {
      bool running = current && *current == item.id;
      out_ << (running ? "* " : "  ")
           << std::left << std::setw(36) << item.id << " "
           << std::setw(10) << to_string(item.state) << " "
           << std::setw(10) << (item.status.empty() ? "-" : item.status) << " "
           << std::setw(8) << item.operation_type << " "
           << item.subject.title << "\n"
           << "      " << item.progress << "\n";
    }
  }

  void print_history() {
    auto records = queue_->list_history();
    if(records.empty()) {
      out_ << "No finished jobs yet.\n";
      return;
    }
    for(const auto& record : records) {
      out_ << record.timestamp << "  "
           << (record.success ? "OK    " : "FAILED") << "  "
           << std::left << std::setw(8) << record.operation_type << " "
           << record.title << "\n";
      if(record.error) {
        out_ << "      [" << record.error_kind << "] " << *record.error << "\n";
      }
    }
  }

  void enqueue_from_catalog(const std::string& operation_type, const std::string& args) {
    if(args.empty()) {
      out_ << "Usage: " << operation_type << " <catalog id>\n";
      return;
    }
    char* end = nullptr;
    long long id = std::strtoll(args.c_str(), &end, 10);
    if(!end || *end != '\0') {
      out_ << "Catalog id must be numeric: " << args << "\n";
      return;
    }
    try {
      auto subject = catalog_->fetch_subject(id);
      auto item = queue_->enqueue(subject, operation_type);
      out_ << "Queued " << item.id << " (" << subject.title << ")\n";
    } catch(const MoverError& e) {
      out_ << "Unable to queue " << operation_type << " of " << id << ": " << e.what() << "\n";
    }
  }

  void enqueue_inline(const std::string& args) {
    std::istringstream iss(args);
    std::string operation_type;
    iss >> operation_type;
    std::string json_text;
    std::getline(iss, json_text);
    json_text = trim(json_text);
    if(operation_type.empty() || json_text.empty()) {
      out_ << "Usage: enqueue <copy|convert> {\"id\":1,\"title\":\"...\",\"location\":\"...\"}\n";
      return;
    }
    try {
      auto subject = subject_from_json(nlohmann::json::parse(json_text));
      auto item = queue_->enqueue(subject, operation_type);
      out_ << "Queued " << item.id << " (" << subject.title << ")\n";
    } catch(const nlohmann::json::parse_error& e) {
      out_ << "Invalid subject JSON: " << e.what() << "\n";
    } catch(const MoverError& e) {
      out_ << "Unable to queue: " << e.what() << "\n";
    }
  }

  void remove_item(const std::string& item_id) {
    if(item_id.empty()) {
      out_ << "Usage: remove <item id>\n";
      return;
    }
    try {
      if(queue_->dequeue(item_id)) {
        out_ << "Removed " << item_id << "\n";
      } else {
        out_ << "No queued item " << item_id << "\n";
      }
    } catch(const PreconditionError& e) {
      out_ << e.what() << "\n";
    }
  }

  void handle_settings_command(const std::string& args) {
    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action == "list") {
      list_settings();
      return;
    }

    if(action == "get") {
      std::string key;
      iss >> key;
      if(key.empty()) {
        out_ << "Usage: settings get <key>\n";
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        out_ << "Unknown setting '" << key << "'.\n";
        return;
      }
      out_ << *resolved << " = " << settings_->display_value(*resolved) << "\n";
      const auto* setting = settings_->find(*resolved);
      if(!setting->description.empty()) {
        out_ << "  " << setting->description << "\n";
      }
      return;
    }

    if(action == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      value = trim(value);
      if(key.empty() || value.empty()) {
        out_ << "Usage: settings set <key> <value>\n";
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        out_ << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::string error;
      if(settings_->set_from_string(*resolved, value, error)) {
        out_ << *resolved << " = " << settings_->display_value(*resolved)
             << " (takes effect after save and restart)\n";
      } else {
        out_ << "Failed to set " << *resolved << ": " << error << "\n";
      }
      return;
    }

    if(action == "save") {
      if(settings_->save()) {
        out_ << "Saved settings to " << settings_->settings_path().string() << "\n";
      } else {
        out_ << "Failed to save settings.\n";
      }
      return;
    }

    if(action == "load") {
      if(settings_->load()) {
        out_ << "Loaded settings from " << settings_->settings_path().string() << "\n";
      } else {
        out_ << "Settings file not found.\n";
      }
      return;
    }

    out_ << "Unknown settings command.\n";
  }

  void list_settings() {
    for(const auto& setting : settings_->settings()) {
      out_ << setting.key << " = " << settings_->display_value(setting.key) << "\n";
    }
  }

  void print_help() {
    out_ << "Available commands:\n";
    out_ << "  help|h|?                          Show this help message\n";
    out_ << "  quit                              Stop the worker and exit\n";
    out_ << "  queue|q                           List queued and running jobs\n";
    out_ << "  history                           List the most recent finished jobs\n";
    out_ << "  copy <catalog id>                 Move a movie from the fast to the slow tier\n";
    out_ << "  convert <catalog id>              Convert a movie's DTS 5.1(side) track to FLAC 7.1\n";
    out_ << "  enqueue <type> <subject json>     Queue a job for an inline subject record\n";
    out_ << "  remove|rm <item id>               Remove a pending job\n";
    out_ << "  clear                             Forget every queued job (running process continues)\n";
    out_ << "  settings [list|get|set|save|load] Manage settings\n";
    out_ << "  set [key value]                   Shortcut for settings set (lists when empty)\n";
    out_ << "  get <key>                         Shortcut for settings get\n";
  }

  std::shared_ptr<OperationQueue> queue_;
  std::shared_ptr<CatalogClient> catalog_;
  std::shared_ptr<SettingsManager> settings_;
  std::ostream& out_;
  std::atomic<bool> running_;
};
