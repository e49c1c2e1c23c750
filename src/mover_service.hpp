#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "log.hpp"
#include "process_runner.hpp"

class CatalogClient;
class HandlerRegistry;
class MediaProber;
class MoverCLI;
class OperationQueue;
class SafeTransfer;
class SettingsManager;

// Wires settings into the transfer engine, handlers, catalog and queue, and
// drives the worker plus the optional operator console.
class MoverService {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    bool start_console = false;
    // Collaborators built from settings when left empty.
    std::shared_ptr<CatalogClient> catalog;
    std::shared_ptr<MediaProber> prober;
    ProcessLauncher launcher;
  };

  MoverService(std::shared_ptr<SettingsManager> settings, Options options);
  ~MoverService();

  MoverService(const MoverService&) = delete;
  MoverService& operator=(const MoverService&) = delete;

  void start();
  // Blocks in the console, or until SIGINT/SIGTERM when headless.
  void run();
  void stop();

  void execute_command(const std::string& line);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<OperationQueue> queue() const { return queue_; }
  std::shared_ptr<CatalogClient> catalog() const { return catalog_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }
  std::filesystem::path data_dir() const;

  LogListenerHandle add_log_listener(Logger::Listener listener);
  void remove_log_listener(LogListenerHandle handle);

private:
  std::filesystem::path resolve_in_workspace(const std::string& value) const;
  void build_components();
  void wait_for_shutdown_signal();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<SafeTransfer> transfer_;
  std::shared_ptr<CatalogClient> catalog_;
  std::shared_ptr<MediaProber> prober_;
  std::shared_ptr<const HandlerRegistry> handlers_;
  std::shared_ptr<OperationQueue> queue_;
  std::unique_ptr<MoverCLI> cli_;
  bool started_ = false;
};
