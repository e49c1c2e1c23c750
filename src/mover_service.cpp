#include "mover_service.hpp"

#include <asio.hpp>

#include <csignal>
#include <iostream>
#include <stdexcept>

#include "catalog_client.hpp"
#include "convert_operation.hpp"
#include "copy_operation.hpp"
#include "digest.hpp"
#include "media_probe.hpp"
#include "mover_cli.hpp"
#include "operation_queue.hpp"
#include "safe_transfer.hpp"
#include "settings_manager.hpp"

namespace fs = std::filesystem;

MoverService::MoverService(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("safemover")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = fs::current_path();
  }
}

MoverService::~MoverService() {
  stop();
}

fs::path MoverService::resolve_in_workspace(const std::string& value) const {
  fs::path path(value);
  if(path.is_relative()) {
    path = options_.workspace_root / path;
  }
  return path.lexically_normal();
}

fs::path MoverService::data_dir() const {
  return resolve_in_workspace(settings_->get<std::string>("data_dir"));
}

void MoverService::build_components() {
  ChecksumEngine checksum(settings_->get<std::string>("digest_algorithm"),
                          static_cast<std::size_t>(settings_->get<long long>("digest_block_size")));
  transfer_ = std::make_shared<SafeTransfer>(std::move(checksum), logger_);

  if(options_.catalog) {
    catalog_ = options_.catalog;
  } else {
    CatalogEndpoint endpoint;
    endpoint.host = settings_->get<std::string>("catalog_host");
    // Bounds are enforced by SettingsManager.
    endpoint.port = static_cast<unsigned short>(settings_->get<long long>("catalog_port"));
    endpoint.api_key = settings_->get<std::string>("catalog_api_key");
    endpoint.api_base = settings_->get<std::string>("catalog_api_base");
    endpoint.timeout = std::chrono::milliseconds(settings_->get<long long>("catalog_timeout_ms"));
    catalog_ = std::make_shared<RadarrCatalogClient>(std::move(endpoint), logger_);
  }

  ProcessLauncher launcher = options_.launcher ? options_.launcher : default_process_launcher();
  prober_ = options_.prober
    ? options_.prober
    : std::make_shared<FfprobeMediaProber>(settings_->get<std::string>("ffprobe_path"), launcher);

  const auto fast_root = settings_->get<std::string>("fast_root");
  const auto slow_root = settings_->get<std::string>("slow_root");
  if(fast_root.empty() || slow_root.empty()) {
    logger_->warn("fast_root/slow_root not configured; copy jobs will fail until they are set");
  }

  CopyOperation::Options copy_options;
  copy_options.fast_root = fast_root;
  copy_options.slow_root = slow_root;
  auto copy = std::make_shared<CopyOperation>(copy_options, transfer_, catalog_, logger_);

  ConvertOperation::Options convert_options;
  convert_options.slow_root = slow_root;
  convert_options.temp_dir = resolve_in_workspace(settings_->get<std::string>("temp_dir"));
  convert_options.ffmpeg_path = settings_->get<std::string>("ffmpeg_path");
  convert_options.mkvmerge_path = settings_->get<std::string>("mkvmerge_path");
  auto convert = std::make_shared<ConvertOperation>(convert_options, prober_, launcher,
                                                    transfer_, catalog_, logger_);

  handlers_ = std::make_shared<const HandlerRegistry>(HandlerRegistry::Map{
    {kCopyOperation, copy},
    {kConvertOperation, convert}
  });

  OperationQueue::Options queue_options;
  queue_options.history_limit = static_cast<std::size_t>(settings_->get<long long>("history_limit"));
  queue_options.poll_interval = std::chrono::milliseconds(settings_->get<long long>("poll_interval_ms"));
  queue_options.progress_flush_interval =
    std::chrono::milliseconds(settings_->get<long long>("progress_flush_ms"));

  auto store = std::make_shared<QueueStore>(data_dir(), logger_);
  queue_ = std::make_shared<OperationQueue>(store, handlers_, queue_options, logger_);
}

void MoverService::start() {
  if(started_) return;
  started_ = true;

  std::error_code ec;
  fs::create_directories(options_.workspace_root, ec);
  if(ec) {
    throw std::runtime_error("Unable to create workspace " + options_.workspace_root.string() +
                             ": " + ec.message());
  }

  LogOptions log_options;
  log_options.verbose = settings_->get<bool>("verbose");
  const auto log_file = settings_->get<std::string>("log_file");
  if(!log_file.empty()) {
    log_options.log_file = resolve_in_workspace(log_file).string();
  }
  init(log_options);

  build_components();
  cli_ = std::make_unique<MoverCLI>(queue_, catalog_, settings_, std::cout);

  queue_->start_background();
  logger_->info("safemover started (fast_root '{}', slow_root '{}', data {})",
                settings_->get<std::string>("fast_root"),
                settings_->get<std::string>("slow_root"),
                data_dir().string());
}

void MoverService::wait_for_shutdown_signal() {
  asio::io_context io;
  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code& ec, int signal_number) {
    if(!ec) {
      logger_->info("Received signal {}, shutting down", signal_number);
    }
  });
  io.run();
}

void MoverService::run() {
  if(!started_) start();
  if(options_.start_console) {
    cli_->run_loop();
  } else {
    wait_for_shutdown_signal();
  }
}

void MoverService::stop() {
  if(!started_) return;
  started_ = false;
  if(queue_) {
    queue_->stop();
  }
}

void MoverService::execute_command(const std::string& line) {
  if(!cli_) {
    throw std::runtime_error("MoverService::execute_command called before start()");
  }
  cli_->execute(line);
}

LogListenerHandle MoverService::add_log_listener(Logger::Listener listener) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener));
}

void MoverService::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}
